#pragma once

#include <glyph_run_builder.hpp>
#include <metrics_typeface.hpp>

#include <catch2/catch_test_macros.hpp>

// Design units match rendering units at this size
static constexpr const float TEST_EM_SIZE = 1000.f;

inline std::shared_ptr<const ShapedText::Typeface> make_test_typeface(float defaultAdvance = 0.f,
		std::vector<float> advances = {}) {
	return std::make_shared<ShapedText::MetricsTypeface>(ShapedText::TypefaceMetrics{
		.designEmHeight = 1000,
		.ascent = -800.f,
		.descent = 200.f,
		.lineGap = 0.f,
	}, defaultAdvance, std::move(advances));
}

inline ShapedText::GlyphRun build_test_run(std::u16string characters, std::vector<uint16_t> clusters,
		std::vector<float> advances, uint8_t bidiLevel, uint32_t characterStart = 0) {
	ShapedText::GlyphRunBuilder builder;
	std::vector<uint16_t> glyphIndices;

	for (size_t i = 0; i < clusters.size(); ++i) {
		glyphIndices.emplace_back(static_cast<uint16_t>(i + 1));
	}

	builder.set_typeface(make_test_typeface());
	builder.set_font_rendering_em_size(TEST_EM_SIZE);
	builder.set_glyph_indices(std::move(glyphIndices));
	builder.set_glyph_advances(std::move(advances));
	builder.set_glyph_clusters(std::move(clusters));
	builder.set_characters(std::move(characters), characterStart);
	builder.set_bidi_level(bidiLevel);

	std::optional<ShapedText::GlyphRun> glyphRun;
	REQUIRE(builder.build(glyphRun) == ShapedText::GlyphRunError::NONE);

	return std::move(*glyphRun);
}
