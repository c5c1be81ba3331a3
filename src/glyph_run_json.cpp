#include "glyph_run_json.hpp"

#include "bidi_level.hpp"
#include "glyph_run_builder.hpp"
#include "metrics_typeface.hpp"
#include "string_conversion.hpp"

#include <simdjson.h>

#include <cstdio>

#include <limits>

using namespace ShapedText;

static GlyphRunError load_glyph_run(simdjson::padded_string& json, GlyphRunBuilder& builder);
static GlyphRunError read_typeface(simdjson::ondemand::object typefaceObject,
		std::shared_ptr<const Typeface>& outTypeface);
static GlyphRunError read_uint16_array(simdjson::ondemand::array array, std::vector<uint16_t>& out);
static GlyphRunError read_float_array(simdjson::ondemand::array array, std::vector<float>& out);
static GlyphRunError read_offsets(simdjson::ondemand::array array, std::vector<Vector2>& out);
static GlyphRunError report_json_error(simdjson::error_code err);

// Public Functions

GlyphRunError ShapedText::load_glyph_run_from_json_data(std::string_view data, GlyphRunBuilder& builder) {
	simdjson::padded_string json(data);
	return load_glyph_run(json, builder);
}

GlyphRunError ShapedText::load_glyph_run_from_json_file(const char* fileName, GlyphRunBuilder& builder) {
	simdjson::padded_string json;

	if (auto err = simdjson::padded_string::load(fileName).get(json); err != 0) {
		fprintf(stderr, "[GlyphRunJson] %s: %s\n", fileName, simdjson::error_message(err));
		return GlyphRunError::FILE_NOT_FOUND;
	}

	return load_glyph_run(json, builder);
}

// Static Functions

static GlyphRunError load_glyph_run(simdjson::padded_string& json, GlyphRunBuilder& builder) {
	simdjson::ondemand::parser parser;
	auto d = parser.iterate(json);

	simdjson::ondemand::object root;
	if (auto err = d.get(root); err != 0) {
		return report_json_error(err);
	}

	simdjson::ondemand::object typefaceObject;
	if (auto err = root["typeface"].get(typefaceObject); err != 0) {
		return report_json_error(err);
	}

	std::shared_ptr<const Typeface> typeface;
	if (auto res = read_typeface(typefaceObject, typeface); res != GlyphRunError::NONE) {
		return res;
	}

	double fontRenderingEmSize;
	if (auto err = root["font_rendering_em_size"].get(fontRenderingEmSize); err != 0) {
		return report_json_error(err);
	}

	std::string_view text;
	if (auto err = root["text"].get(text); err != 0) {
		return report_json_error(err);
	}

	uint64_t characterStart = 0;
	if (auto err = root["character_start"].get(characterStart); err != 0 && err != simdjson::NO_SUCH_FIELD) {
		return report_json_error(err);
	}

	if (characterStart > std::numeric_limits<uint16_t>::max()) {
		return GlyphRunError::INVALID_JSON;
	}

	std::vector<uint16_t> glyphIndices;
	simdjson::ondemand::array glyphIndexArray;
	if (auto err = root["glyph_indices"].get(glyphIndexArray); err != 0) {
		return report_json_error(err);
	}

	if (auto res = read_uint16_array(glyphIndexArray, glyphIndices); res != GlyphRunError::NONE) {
		return res;
	}

	std::vector<float> glyphAdvances;
	simdjson::ondemand::array glyphAdvanceArray;
	if (auto err = root["glyph_advances"].get(glyphAdvanceArray); err == 0) {
		if (auto res = read_float_array(glyphAdvanceArray, glyphAdvances); res != GlyphRunError::NONE) {
			return res;
		}
	}
	else if (err != simdjson::NO_SUCH_FIELD) {
		return report_json_error(err);
	}

	std::vector<Vector2> glyphOffsets;
	simdjson::ondemand::array glyphOffsetArray;
	if (auto err = root["glyph_offsets"].get(glyphOffsetArray); err == 0) {
		if (auto res = read_offsets(glyphOffsetArray, glyphOffsets); res != GlyphRunError::NONE) {
			return res;
		}
	}
	else if (err != simdjson::NO_SUCH_FIELD) {
		return report_json_error(err);
	}

	std::vector<uint16_t> glyphClusters;
	simdjson::ondemand::array glyphClusterArray;
	if (auto err = root["glyph_clusters"].get(glyphClusterArray); err != 0) {
		return report_json_error(err);
	}

	if (auto res = read_uint16_array(glyphClusterArray, glyphClusters); res != GlyphRunError::NONE) {
		return res;
	}

	auto characters = utf8_to_utf16(text);

	uint64_t bidiLevel;
	if (auto err = root["bidi_level"].get(bidiLevel); err == simdjson::NO_SUCH_FIELD) {
		bidiLevel = resolve_base_bidi_level(characters);
	}
	else if (err != 0) {
		return report_json_error(err);
	}
	else if (bidiLevel > std::numeric_limits<uint8_t>::max()) {
		return GlyphRunError::INVALID_JSON;
	}

	simdjson::ondemand::array boundsArray;
	if (auto err = root["bounds"].get(boundsArray); err == 0) {
		std::vector<float> bounds;

		if (auto res = read_float_array(boundsArray, bounds); res != GlyphRunError::NONE) {
			return res;
		}

		if (bounds.size() != 4) {
			return GlyphRunError::INVALID_JSON;
		}

		builder.set_bounds({bounds[0], bounds[1], bounds[2], bounds[3]});
	}
	else if (err != simdjson::NO_SUCH_FIELD) {
		return report_json_error(err);
	}

	builder.set_typeface(std::move(typeface));
	builder.set_font_rendering_em_size(static_cast<float>(fontRenderingEmSize));
	builder.set_glyph_indices(std::move(glyphIndices));
	builder.set_glyph_advances(std::move(glyphAdvances));
	builder.set_glyph_offsets(std::move(glyphOffsets));
	builder.set_glyph_clusters(std::move(glyphClusters));
	builder.set_characters(std::move(characters), static_cast<uint32_t>(characterStart));
	builder.set_bidi_level(static_cast<uint8_t>(bidiLevel));

	return GlyphRunError::NONE;
}

static GlyphRunError read_typeface(simdjson::ondemand::object typefaceObject,
		std::shared_ptr<const Typeface>& outTypeface) {
	uint64_t designEmHeight;
	if (auto err = typefaceObject["design_em_height"].get(designEmHeight); err != 0) {
		return report_json_error(err);
	}

	if (designEmHeight > std::numeric_limits<uint32_t>::max()) {
		return GlyphRunError::INVALID_JSON;
	}

	double ascent;
	if (auto err = typefaceObject["ascent"].get(ascent); err != 0) {
		return report_json_error(err);
	}

	double descent;
	if (auto err = typefaceObject["descent"].get(descent); err != 0) {
		return report_json_error(err);
	}

	double lineGap = 0.0;
	if (auto err = typefaceObject["line_gap"].get(lineGap); err != 0 && err != simdjson::NO_SUCH_FIELD) {
		return report_json_error(err);
	}

	double defaultAdvance = 0.0;
	if (auto err = typefaceObject["default_advance"].get(defaultAdvance);
			err != 0 && err != simdjson::NO_SUCH_FIELD) {
		return report_json_error(err);
	}

	std::vector<float> advances;
	simdjson::ondemand::array advanceArray;
	if (auto err = typefaceObject["advances"].get(advanceArray); err == 0) {
		if (auto res = read_float_array(advanceArray, advances); res != GlyphRunError::NONE) {
			return res;
		}
	}
	else if (err != simdjson::NO_SUCH_FIELD) {
		return report_json_error(err);
	}

	TypefaceMetrics metrics{
		.designEmHeight = static_cast<uint32_t>(designEmHeight),
		.ascent = static_cast<float>(ascent),
		.descent = static_cast<float>(descent),
		.lineGap = static_cast<float>(lineGap),
	};

	outTypeface = std::make_shared<MetricsTypeface>(metrics, static_cast<float>(defaultAdvance),
			std::move(advances));

	return GlyphRunError::NONE;
}

static GlyphRunError read_uint16_array(simdjson::ondemand::array array, std::vector<uint16_t>& out) {
	for (auto element : array) {
		uint64_t value;
		if (auto err = element.get(value); err != 0) {
			return report_json_error(err);
		}

		if (value > std::numeric_limits<uint16_t>::max()) {
			return GlyphRunError::INVALID_JSON;
		}

		out.emplace_back(static_cast<uint16_t>(value));
	}

	return GlyphRunError::NONE;
}

static GlyphRunError read_float_array(simdjson::ondemand::array array, std::vector<float>& out) {
	for (auto element : array) {
		double value;
		if (auto err = element.get(value); err != 0) {
			return report_json_error(err);
		}

		out.emplace_back(static_cast<float>(value));
	}

	return GlyphRunError::NONE;
}

static GlyphRunError read_offsets(simdjson::ondemand::array array, std::vector<Vector2>& out) {
	for (auto element : array) {
		simdjson::ondemand::array pairArray;
		if (auto err = element.get(pairArray); err != 0) {
			return report_json_error(err);
		}

		std::vector<float> pair;
		if (auto res = read_float_array(pairArray, pair); res != GlyphRunError::NONE) {
			return res;
		}

		if (pair.size() != 2) {
			return GlyphRunError::INVALID_JSON;
		}

		out.push_back({pair[0], pair[1]});
	}

	return GlyphRunError::NONE;
}

static GlyphRunError report_json_error(simdjson::error_code err) {
	fprintf(stderr, "[GlyphRunJson] %s\n", simdjson::error_message(err));
	return GlyphRunError::INVALID_JSON;
}
