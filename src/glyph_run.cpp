#include "glyph_run.hpp"

#include "cluster_search.hpp"

#include <utility>

using namespace ShapedText;

GlyphRun::GlyphRun(std::shared_ptr<const Typeface> typeface, float fontRenderingEmSize,
			std::vector<uint16_t> glyphIndices, std::vector<float> glyphAdvances,
			std::vector<Vector2> glyphOffsets, std::vector<uint16_t> glyphClusters, std::u16string characters,
			uint32_t characterStart, uint8_t bidiLevel, std::optional<Rect> bounds,
			const GlyphRunDrawableFunctions& drawableFunctions)
		: m_typeface(std::move(typeface))
		, m_fontRenderingEmSize(fontRenderingEmSize)
		, m_scale(fontRenderingEmSize / static_cast<float>(m_typeface->get_design_em_height()))
		, m_glyphIndices(std::move(glyphIndices))
		, m_glyphAdvances(std::move(glyphAdvances))
		, m_glyphOffsets(std::move(glyphOffsets))
		, m_glyphClusters(std::move(glyphClusters))
		, m_characters(std::move(characters))
		, m_characterStart(characterStart)
		, m_bidiLevel(bidiLevel)
		, m_drawableFunctions(drawableFunctions)
		, m_bounds(bounds) {}

GlyphRun::~GlyphRun() {
	release_drawable();
}

GlyphRun::GlyphRun(GlyphRun&& other) noexcept {
	*this = std::move(other);
}

GlyphRun& GlyphRun::operator=(GlyphRun&& other) noexcept {
	std::swap(m_typeface, other.m_typeface);
	std::swap(m_fontRenderingEmSize, other.m_fontRenderingEmSize);
	std::swap(m_scale, other.m_scale);
	std::swap(m_glyphIndices, other.m_glyphIndices);
	std::swap(m_glyphAdvances, other.m_glyphAdvances);
	std::swap(m_glyphOffsets, other.m_glyphOffsets);
	std::swap(m_glyphClusters, other.m_glyphClusters);
	std::swap(m_characters, other.m_characters);
	std::swap(m_characterStart, other.m_characterStart);
	std::swap(m_bidiLevel, other.m_bidiLevel);
	std::swap(m_drawableFunctions, other.m_drawableFunctions);
	std::swap(m_bounds, other.m_bounds);
	std::swap(m_drawable, other.m_drawable);
	std::swap(m_drawableRequested, other.m_drawableRequested);
	return *this;
}

std::optional<uint32_t> GlyphRun::find_glyph_index(uint32_t characterIndex) const {
	auto glyphCount = get_glyph_count();

	if (is_left_to_right()) {
		if (characterIndex < m_glyphClusters.front()) {
			return 0;
		}

		if (characterIndex >= get_character_end()) {
			return glyphCount;
		}
	}
	else {
		// The logically first cluster sits at the end of the glyph array
		if (characterIndex < m_glyphClusters.back()) {
			auto index = glyphCount - 1;

			while (index > 0 && m_glyphClusters[index - 1] == m_glyphClusters[index]) {
				--index;
			}

			return index;
		}

		if (characterIndex > m_glyphClusters.front()) {
			return 0;
		}
	}

	auto start = find_containing_cluster(m_glyphClusters.data(), glyphCount, characterIndex,
			!is_left_to_right());

	if (start == glyphCount) {
		return {};
	}

	return static_cast<uint32_t>(start);
}

CharacterHit GlyphRun::find_nearest_character_hit(uint32_t characterIndex, float& outWidth) const {
	outWidth = 0.f;

	auto glyphIndex = find_glyph_index(characterIndex);

	if (!glyphIndex || *glyphIndex == get_glyph_count()) {
		return {characterIndex, 0};
	}

	uint32_t clusterEnd;
	outWidth = get_cluster_width(*glyphIndex, clusterEnd);

	return {m_glyphClusters[*glyphIndex], get_cluster_character_span(*glyphIndex, clusterEnd)};
}

float GlyphRun::get_distance_from_character_hit(CharacterHit characterHit) const {
	if (characterHit.get_caret_index() > get_character_end()) {
		return get_bounds().width;
	}

	auto glyphIndex = find_glyph_index(characterHit.firstCharacterIndex);

	if (!glyphIndex) {
		return 0.f;
	}

	auto endGlyph = *glyphIndex;
	auto glyphCount = get_glyph_count();

	if (characterHit.is_trailing() && endGlyph < glyphCount) {
		auto cluster = m_glyphClusters[endGlyph];

		while (endGlyph < glyphCount && m_glyphClusters[endGlyph] == cluster) {
			++endGlyph;
		}
	}

	float distance = 0.f;

	for (uint32_t i = 0; i < endGlyph; ++i) {
		distance += get_glyph_advance(i);
	}

	return distance;
}

CharacterHit GlyphRun::get_character_hit_from_distance(float distance, bool& outIsInside) const {
	float width;

	// Before
	if (distance < 0.f) {
		outIsInside = false;

		auto firstHit = find_nearest_character_hit(m_glyphClusters.front(), width);

		return is_left_to_right() ? firstHit.get_leading_edge() : firstHit;
	}

	// After
	if (distance > get_bounds().width) {
		outIsInside = false;

		auto lastHit = find_nearest_character_hit(m_glyphClusters.back(), width);

		return is_left_to_right() ? lastHit : lastHit.get_leading_edge();
	}

	// Within
	auto glyphCount = get_glyph_count();
	float currentX = 0.f;
	uint32_t index = 0;

	for (; index < glyphCount; ++index) {
		auto advance = get_glyph_advance(index);

		if (currentX + advance >= distance) {
			break;
		}

		currentX += advance;
	}

	// Supplied bounds may be wider than the glyphs
	if (index == glyphCount) {
		--index;
	}

	auto characterHit = find_nearest_character_hit(m_glyphClusters[index], width);
	auto offset = get_distance_from_character_hit(characterHit.get_leading_edge());

	outIsInside = true;

	bool isTrailing = distance > offset + width / 2.f;

	return isTrailing ? characterHit : characterHit.get_leading_edge();
}

CharacterHit GlyphRun::get_next_caret_character_hit(CharacterHit characterHit) const {
	if (characterHit.get_caret_index() >= get_character_end()) {
		return characterHit;
	}

	float width;

	if (!characterHit.is_trailing()) {
		return find_nearest_character_hit(characterHit.firstCharacterIndex, width);
	}

	// The trailing edge of this cluster is the leading edge of the next one, step over the next cluster
	return find_nearest_character_hit(characterHit.get_caret_index(), width);
}

CharacterHit GlyphRun::get_previous_caret_character_hit(CharacterHit characterHit) const {
	if (characterHit.is_trailing()) {
		return characterHit.get_leading_edge();
	}

	if (characterHit.firstCharacterIndex <= m_characterStart) {
		return {m_characterStart, 0};
	}

	float width;
	return find_nearest_character_hit(characterHit.firstCharacterIndex - 1, width).get_leading_edge();
}

const Rect& GlyphRun::get_bounds() const {
	if (!m_bounds) {
		m_bounds = calc_bounds();
	}

	return *m_bounds;
}

const GlyphRunDrawable& GlyphRun::get_drawable() const {
	if (!m_drawableRequested) {
		m_drawableRequested = true;

		if (m_drawableFunctions.pfnCreateDrawable) {
			m_drawable = m_drawableFunctions.pfnCreateDrawable(*this, m_drawableFunctions.pUserData);
		}
	}

	return m_drawable;
}

float GlyphRun::get_glyph_advance(uint32_t glyphIndex) const {
	if (m_glyphAdvances.empty()) {
		return m_typeface->get_glyph_advance(m_glyphIndices[glyphIndex]) * m_scale;
	}

	return m_glyphAdvances[glyphIndex];
}

const std::shared_ptr<const Typeface>& GlyphRun::get_typeface() const {
	return m_typeface;
}

float GlyphRun::get_font_rendering_em_size() const {
	return m_fontRenderingEmSize;
}

float GlyphRun::get_scale() const {
	return m_scale;
}

const std::vector<uint16_t>& GlyphRun::get_glyph_indices() const {
	return m_glyphIndices;
}

const std::vector<float>& GlyphRun::get_glyph_advances() const {
	return m_glyphAdvances;
}

const std::vector<Vector2>& GlyphRun::get_glyph_offsets() const {
	return m_glyphOffsets;
}

const std::vector<uint16_t>& GlyphRun::get_glyph_clusters() const {
	return m_glyphClusters;
}

uint32_t GlyphRun::get_glyph_count() const {
	return static_cast<uint32_t>(m_glyphIndices.size());
}

std::u16string_view GlyphRun::get_characters() const {
	return m_characters;
}

uint32_t GlyphRun::get_character_start() const {
	return m_characterStart;
}

uint32_t GlyphRun::get_character_length() const {
	return static_cast<uint32_t>(m_characters.size());
}

uint32_t GlyphRun::get_character_end() const {
	return m_characterStart + get_character_length();
}

uint8_t GlyphRun::get_bidi_level() const {
	return m_bidiLevel;
}

bool GlyphRun::is_left_to_right() const {
	return (m_bidiLevel & 1) == 0;
}

// Private

Rect GlyphRun::calc_bounds() const {
	auto height = (m_typeface->get_descent() - m_typeface->get_ascent() + m_typeface->get_line_gap())
			* m_scale;
	float width = 0.f;

	for (uint32_t i = 0; i < get_glyph_count(); ++i) {
		width += get_glyph_advance(i);
	}

	return {0.f, 0.f, width, height};
}

float GlyphRun::get_cluster_width(uint32_t clusterStartGlyph, uint32_t& outClusterEndGlyph) const {
	auto cluster = m_glyphClusters[clusterStartGlyph];
	auto glyphCount = get_glyph_count();
	float width = 0.f;

	outClusterEndGlyph = clusterStartGlyph;

	while (outClusterEndGlyph < glyphCount && m_glyphClusters[outClusterEndGlyph] == cluster) {
		width += get_glyph_advance(outClusterEndGlyph);
		++outClusterEndGlyph;
	}

	return width;
}

uint32_t GlyphRun::get_cluster_character_span(uint32_t clusterStartGlyph, uint32_t clusterEndGlyph) const {
	uint32_t nextCluster;

	// The logically following cluster sits after this one in LTR runs and before it in RTL runs. The last
	// cluster absorbs any trailing characters that produced no glyphs.
	if (is_left_to_right()) {
		nextCluster = clusterEndGlyph < get_glyph_count() ? m_glyphClusters[clusterEndGlyph]
				: get_character_end();
	}
	else {
		nextCluster = clusterStartGlyph > 0 ? m_glyphClusters[clusterStartGlyph - 1] : get_character_end();
	}

	return nextCluster - m_glyphClusters[clusterStartGlyph];
}

void GlyphRun::release_drawable() {
	if (m_drawable.valid() && m_drawableFunctions.pfnDestroyDrawable) {
		m_drawableFunctions.pfnDestroyDrawable(m_drawable, m_drawableFunctions.pUserData);
	}

	m_drawable = {};
}
