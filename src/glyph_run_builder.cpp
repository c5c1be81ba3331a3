#include "glyph_run_builder.hpp"

using namespace ShapedText;

void GlyphRunBuilder::set_typeface(std::shared_ptr<const Typeface> typeface) {
	m_typeface = std::move(typeface);
}

void GlyphRunBuilder::set_font_rendering_em_size(float fontRenderingEmSize) {
	m_fontRenderingEmSize = fontRenderingEmSize;
}

void GlyphRunBuilder::set_glyph_indices(std::vector<uint16_t> glyphIndices) {
	m_glyphIndices = std::move(glyphIndices);
}

void GlyphRunBuilder::set_glyph_advances(std::vector<float> glyphAdvances) {
	m_glyphAdvances = std::move(glyphAdvances);
}

void GlyphRunBuilder::set_glyph_offsets(std::vector<Vector2> glyphOffsets) {
	m_glyphOffsets = std::move(glyphOffsets);
}

void GlyphRunBuilder::set_glyph_clusters(std::vector<uint16_t> glyphClusters) {
	m_glyphClusters = std::move(glyphClusters);
}

void GlyphRunBuilder::set_characters(std::u16string characters, uint32_t characterStart) {
	m_characters = std::move(characters);
	m_characterStart = characterStart;
}

void GlyphRunBuilder::set_bidi_level(uint8_t bidiLevel) {
	m_bidiLevel = bidiLevel;
}

void GlyphRunBuilder::set_bounds(const Rect& bounds) {
	m_bounds = bounds;
}

void GlyphRunBuilder::set_drawable_functions(const GlyphRunDrawableFunctions& funcs) {
	m_drawableFunctions = funcs;
}

void GlyphRunBuilder::append_glyph(uint16_t glyph, uint16_t cluster, float advance, Vector2 offset) {
	m_glyphIndices.emplace_back(glyph);
	m_glyphClusters.emplace_back(cluster);
	m_glyphAdvances.emplace_back(advance);
	m_glyphOffsets.emplace_back(offset);
}

void GlyphRunBuilder::reserve_glyphs(size_t glyphCount) {
	m_glyphIndices.reserve(glyphCount);
	m_glyphClusters.reserve(glyphCount);
	m_glyphAdvances.reserve(glyphCount);
	m_glyphOffsets.reserve(glyphCount);
}

GlyphRunError GlyphRunBuilder::build(std::optional<GlyphRun>& outGlyphRun) {
	if (auto err = validate(); err != GlyphRunError::NONE) {
		return err;
	}

	outGlyphRun.emplace(GlyphRun(std::move(m_typeface), m_fontRenderingEmSize, std::move(m_glyphIndices),
			std::move(m_glyphAdvances), std::move(m_glyphOffsets), std::move(m_glyphClusters),
			std::move(m_characters), m_characterStart, m_bidiLevel, m_bounds, m_drawableFunctions));

	clear();

	return GlyphRunError::NONE;
}

void GlyphRunBuilder::clear() {
	m_typeface = {};
	m_fontRenderingEmSize = 0.f;
	m_glyphIndices.clear();
	m_glyphAdvances.clear();
	m_glyphOffsets.clear();
	m_glyphClusters.clear();
	m_characters.clear();
	m_characterStart = 0;
	m_bidiLevel = 0;
	m_bounds.reset();
	m_drawableFunctions = {};
}

// Private

GlyphRunError GlyphRunBuilder::validate() const {
	if (!m_typeface) {
		return GlyphRunError::NO_TYPEFACE;
	}

	if (m_typeface->get_design_em_height() == 0) {
		return GlyphRunError::INVALID_TYPEFACE_METRICS;
	}

	// Negated to also reject NaN
	if (!(m_fontRenderingEmSize > 0.f)) {
		return GlyphRunError::INVALID_EM_SIZE;
	}

	auto glyphCount = m_glyphIndices.size();

	if (glyphCount == 0) {
		return GlyphRunError::NO_GLYPHS;
	}

	if (!m_glyphAdvances.empty() && m_glyphAdvances.size() != glyphCount) {
		return GlyphRunError::ADVANCE_COUNT_MISMATCH;
	}

	if (!m_glyphOffsets.empty() && m_glyphOffsets.size() != glyphCount) {
		return GlyphRunError::OFFSET_COUNT_MISMATCH;
	}

	if (m_glyphClusters.size() != glyphCount) {
		return GlyphRunError::CLUSTER_COUNT_MISMATCH;
	}

	auto characterEnd = static_cast<size_t>(m_characterStart) + m_characters.size();

	for (auto cluster : m_glyphClusters) {
		if (cluster < m_characterStart || cluster >= characterEnd) {
			return GlyphRunError::CLUSTER_OUT_OF_RANGE;
		}
	}

	bool rightToLeft = m_bidiLevel & 1;

	for (size_t i = 1; i < glyphCount; ++i) {
		if (rightToLeft ? m_glyphClusters[i] > m_glyphClusters[i - 1]
				: m_glyphClusters[i] < m_glyphClusters[i - 1]) {
			return GlyphRunError::CLUSTERS_NOT_MONOTONIC;
		}
	}

	return GlyphRunError::NONE;
}
