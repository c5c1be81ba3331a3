#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "bidi_level.hpp"
#include "font_typeface.hpp"
#include "glyph_run_builder.hpp"
#include "glyph_run_json.hpp"
#include "glyph_run_shaper.hpp"
#include "string_conversion.hpp"

#include <optional>
#include <vector>

using namespace ShapedText;

struct InspectOptions {
	const char* runFileName;
	const char* fontFileName;
	const char* text;
	float fontRenderingEmSize;
	std::optional<uint8_t> bidiLevel;
	std::vector<float> distances;
};

static void print_usage();
static bool parse_float(const char* arg, float& out);
static bool parse_options(int argc, char** argv, InspectOptions& options);

static bool build_from_json(const InspectOptions& options, std::optional<GlyphRun>& outGlyphRun);
static bool build_from_font(const InspectOptions& options, std::optional<GlyphRun>& outGlyphRun);

static void print_clusters(const GlyphRun& glyphRun);
static void print_caret_walk(const GlyphRun& glyphRun);
static void print_hits(const GlyphRun& glyphRun, const std::vector<float>& distances);

int main(int argc, char** argv) {
	InspectOptions options{};

	if (!parse_options(argc, argv, options)) {
		print_usage();
		return 1;
	}

	std::optional<GlyphRun> glyphRun;

	if (options.runFileName ? !build_from_json(options, glyphRun) : !build_from_font(options, glyphRun)) {
		return 1;
	}

	auto& bounds = glyphRun->get_bounds();
	printf("bounds: x=%g y=%g width=%g height=%g\n", bounds.x, bounds.y, bounds.width, bounds.height);
	printf("direction: %s, glyphs: %u, characters: [%u, %u)\n", glyphRun->is_left_to_right() ? "LTR" : "RTL",
			glyphRun->get_glyph_count(), glyphRun->get_character_start(), glyphRun->get_character_end());

	print_clusters(*glyphRun);
	print_caret_walk(*glyphRun);
	print_hits(*glyphRun, options.distances);

	return 0;
}

// Static Functions

static void print_usage() {
	fputs("usage: shaped_text_inspect <run.json> [distance...]\n"
			"       shaped_text_inspect --font <file> --size <em size> [--rtl|--ltr] <text> [distance...]\n",
			stderr);
}

static bool parse_float(const char* arg, float& out) {
	char* end;
	out = std::strtof(arg, &end);
	return end != arg && *end == '\0';
}

static bool parse_options(int argc, char** argv, InspectOptions& options) {
	int i = 1;

	for (; i < argc && std::strncmp(argv[i], "--", 2) == 0; ++i) {
		if (std::strcmp(argv[i], "--font") == 0 && i + 1 < argc) {
			options.fontFileName = argv[++i];
		}
		else if (std::strcmp(argv[i], "--size") == 0 && i + 1 < argc) {
			if (!parse_float(argv[++i], options.fontRenderingEmSize)) {
				fprintf(stderr, "[Inspect] Invalid em size '%s'\n", argv[i]);
				return false;
			}
		}
		else if (std::strcmp(argv[i], "--rtl") == 0) {
			options.bidiLevel = 1;
		}
		else if (std::strcmp(argv[i], "--ltr") == 0) {
			options.bidiLevel = 0;
		}
		else {
			fprintf(stderr, "[Inspect] Unknown option '%s'\n", argv[i]);
			return false;
		}
	}

	if (i >= argc) {
		return false;
	}

	if (options.fontFileName) {
		options.text = argv[i++];
	}
	else if (options.bidiLevel || options.fontRenderingEmSize != 0.f) {
		fputs("[Inspect] --size, --rtl and --ltr require --font\n", stderr);
		return false;
	}
	else {
		options.runFileName = argv[i++];
	}

	for (; i < argc; ++i) {
		float distance;

		if (!parse_float(argv[i], distance)) {
			fprintf(stderr, "[Inspect] Invalid distance '%s'\n", argv[i]);
			return false;
		}

		options.distances.emplace_back(distance);
	}

	return true;
}

static bool build_from_json(const InspectOptions& options, std::optional<GlyphRun>& outGlyphRun) {
	GlyphRunBuilder builder;

	if (auto res = load_glyph_run_from_json_file(options.runFileName, builder); res != GlyphRunError::NONE) {
		fprintf(stderr, "[Inspect] Failed to load %s: %s\n", options.runFileName, glyph_run_error_to_string(res));
		return false;
	}

	if (auto res = builder.build(outGlyphRun); res != GlyphRunError::NONE) {
		fprintf(stderr, "[Inspect] Invalid run in %s: %s\n", options.runFileName, glyph_run_error_to_string(res));
		return false;
	}

	return true;
}

static bool build_from_font(const InspectOptions& options, std::optional<GlyphRun>& outGlyphRun) {
	std::shared_ptr<const FontTypeface> typeface;

	if (auto res = FontTypeface::load(options.fontFileName, 0, typeface); res != TypefaceError::NONE) {
		fprintf(stderr, "[Inspect] Failed to load font %s: %s\n", options.fontFileName,
				typeface_error_to_string(res));
		return false;
	}

	auto text = utf8_to_utf16(options.text);
	auto bidiLevel = options.bidiLevel ? *options.bidiLevel : resolve_base_bidi_level(text);

	GlyphRunShaper shaper;
	GlyphRunBuilder builder;

	if (auto res = shaper.shape(builder, std::move(typeface), options.fontRenderingEmSize, text, 0, bidiLevel);
			res != GlyphRunError::NONE) {
		fprintf(stderr, "[Inspect] Failed to shape text: %s\n", glyph_run_error_to_string(res));
		return false;
	}

	if (auto res = builder.build(outGlyphRun); res != GlyphRunError::NONE) {
		fprintf(stderr, "[Inspect] Invalid shaped run: %s\n", glyph_run_error_to_string(res));
		return false;
	}

	return true;
}

static void print_clusters(const GlyphRun& glyphRun) {
	auto& clusters = glyphRun.get_glyph_clusters();

	puts("clusters:");

	for (uint32_t i = 0; i < glyphRun.get_glyph_count(); ++i) {
		if (i > 0 && clusters[i] == clusters[i - 1]) {
			continue;
		}

		float width;
		auto hit = glyphRun.find_nearest_character_hit(clusters[i], width);
		auto offset = glyphRun.get_distance_from_character_hit(hit.get_leading_edge());

		printf("  glyph %u: hit {%u, %u} offset %g width %g\n", i, hit.firstCharacterIndex,
				hit.trailingLength, offset, width);
	}
}

static void print_caret_walk(const GlyphRun& glyphRun) {
	CharacterHit hit{glyphRun.get_character_start(), 0};

	printf("carets: %u (%g)", hit.get_caret_index(), glyphRun.get_distance_from_character_hit(hit));

	for (;;) {
		auto next = glyphRun.get_next_caret_character_hit(hit);

		if (next == hit) {
			break;
		}

		hit = next;
		printf(" -> %u (%g)", hit.get_caret_index(), glyphRun.get_distance_from_character_hit(hit));
	}

	putchar('\n');
}

static void print_hits(const GlyphRun& glyphRun, const std::vector<float>& distances) {
	for (auto distance : distances) {
		bool isInside;
		auto hit = glyphRun.get_character_hit_from_distance(distance, isInside);

		printf("distance %g: hit {%u, %u} %s\n", distance, hit.firstCharacterIndex, hit.trailingLength,
				isInside ? "inside" : "outside");
	}
}
