#include "glyph_run_shaper.hpp"

#include "font_typeface.hpp"
#include "glyph_run_builder.hpp"

#include <hb.h>

#include <limits>
#include <string>
#include <utility>

using namespace ShapedText;

static constexpr const size_t MAX_CLUSTER_COUNT = static_cast<size_t>(std::numeric_limits<uint16_t>::max()) + 1;

GlyphRunShaper::GlyphRunShaper()
		: m_buffer(hb_buffer_create()) {
	// Clusters must stay monotonic in the run direction for caret lookups
	hb_buffer_set_cluster_level(m_buffer, HB_BUFFER_CLUSTER_LEVEL_MONOTONE_CHARACTERS);
}

GlyphRunShaper::~GlyphRunShaper() {
	if (m_buffer) {
		hb_buffer_destroy(m_buffer);
	}
}

GlyphRunShaper::GlyphRunShaper(GlyphRunShaper&& other) noexcept
		: m_buffer(std::exchange(other.m_buffer, nullptr)) {}

GlyphRunShaper& GlyphRunShaper::operator=(GlyphRunShaper&& other) noexcept {
	std::swap(m_buffer, other.m_buffer);
	return *this;
}

GlyphRunError GlyphRunShaper::shape(GlyphRunBuilder& builder, std::shared_ptr<const FontTypeface> typeface,
		float fontRenderingEmSize, std::u16string_view text, uint32_t characterStart, uint8_t bidiLevel) {
	if (!typeface) {
		return GlyphRunError::NO_TYPEFACE;
	}

	if (text.empty()) {
		return GlyphRunError::NO_GLYPHS;
	}

	if (static_cast<size_t>(characterStart) + text.size() > MAX_CLUSTER_COUNT) {
		return GlyphRunError::CLUSTER_OUT_OF_RANGE;
	}

	bool rightToLeft = bidiLevel & 1;

	hb_buffer_clear_contents(m_buffer);
	hb_buffer_set_direction(m_buffer, rightToLeft ? HB_DIRECTION_RTL : HB_DIRECTION_LTR);
	hb_buffer_add_utf16(m_buffer, reinterpret_cast<const uint16_t*>(text.data()),
			static_cast<int>(text.size()), 0, static_cast<int>(text.size()));
	// Fills in script and language, the direction set above is kept
	hb_buffer_guess_segment_properties(m_buffer);

	hb_shape(typeface->get_hb_font(), m_buffer, nullptr, 0);

	// HarfBuzz reports allocation failure only through the buffer state
	if (!hb_buffer_allocation_successful(m_buffer)) {
		return GlyphRunError::SHAPING_FAILED;
	}

	auto glyphCount = hb_buffer_get_length(m_buffer);
	auto* glyphInfos = hb_buffer_get_glyph_infos(m_buffer, nullptr);
	auto* glyphPositions = hb_buffer_get_glyph_positions(m_buffer, nullptr);
	auto scale = fontRenderingEmSize / static_cast<float>(typeface->get_design_em_height());

	builder.reserve_glyphs(glyphCount);

	// HarfBuzz emits RTL buffers in visual order already
	for (unsigned i = 0; i < glyphCount; ++i) {
		builder.append_glyph(static_cast<uint16_t>(glyphInfos[i].codepoint),
				static_cast<uint16_t>(glyphInfos[i].cluster + characterStart),
				static_cast<float>(glyphPositions[i].x_advance) * scale,
				{static_cast<float>(glyphPositions[i].x_offset) * scale,
				-static_cast<float>(glyphPositions[i].y_offset) * scale});
	}

	builder.set_typeface(std::move(typeface));
	builder.set_font_rendering_em_size(fontRenderingEmSize);
	builder.set_characters(std::u16string(text), characterStart);
	builder.set_bidi_level(bidiLevel);

	return GlyphRunError::NONE;
}
