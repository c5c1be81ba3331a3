#pragma once

#include "character_hit.hpp"
#include "geometry.hpp"
#include "typeface.hpp"

#include <cstdint>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ShapedText {

class GlyphRun;

/**
 * A platform drawable created for a glyph run. `handle` is owned by the platform functions that created it
 * and is `nullptr` when no drawable exists.
 */
struct GlyphRunDrawable {
	void* handle;
	float measuredWidth;

	constexpr bool valid() const {
		return handle != nullptr;
	}

	constexpr explicit operator bool() const {
		return valid();
	}
};

struct GlyphRunDrawableFunctions {
	GlyphRunDrawable (*pfnCreateDrawable)(const GlyphRun& glyphRun, void* pUserData);
	void (*pfnDestroyDrawable)(const GlyphRunDrawable& drawable, void* pUserData);
	void* pUserData;
};

/**
 * A sequence of glyphs from a single face of a single font at a single size and direction, along with the
 * mapping from glyphs back to the characters they were shaped from.
 *
 * Glyphs are stored in visual order, left to right. For right-to-left runs this means `glyphClusters` is
 * in descending order.
 *
 * Runs are created through `GlyphRunBuilder` and are immutable afterwards. The bounds and the platform
 * drawable are computed on first request.
 *
 * @thread_safety Queries may be made from multiple threads only after `get_bounds()` and `get_drawable()`
 * have been called at least once, or with external synchronization.
 */
class GlyphRun {
	public:
		~GlyphRun();

		GlyphRun(GlyphRun&&) noexcept;
		GlyphRun& operator=(GlyphRun&&) noexcept;

		GlyphRun(const GlyphRun&) = delete;
		void operator=(const GlyphRun&) = delete;

		/**
		 * Gets the index of the first glyph of the cluster containing `characterIndex`.
		 *
		 * Indices outside the clusters clamp to the logically first or last cluster. Left-to-right runs return
		 * 0 below the first cluster and the glyph count at or past the end of the character range.
		 * Right-to-left runs return 0 above the first cluster and the first glyph of the last cluster below it.
		 *
		 * Returns an empty value if no cluster covers the index.
		 */
		[[nodiscard]] std::optional<uint32_t> find_glyph_index(uint32_t characterIndex) const;

		/**
		 * Gets the trailing-edge hit of the cluster containing `characterIndex`, spanning all characters
		 * of the cluster. `outWidth` receives the summed advance of the cluster's glyphs.
		 *
		 * If no cluster covers the index, returns `{characterIndex, 0}` and a width of 0.
		 */
		CharacterHit find_nearest_character_hit(uint32_t characterIndex, float& outWidth) const;

		/**
		 * Gets the offset from the run origin to the leading or trailing edge of the cluster identified by
		 * `characterHit`. Hits past the end of the character range return the full run width.
		 */
		float get_distance_from_character_hit(CharacterHit characterHit) const;

		/**
		 * Gets the character hit closest to the horizontal offset `distance` from the run origin.
		 * The trailing edge is chosen once `distance` passes the middle of the hit cluster.
		 *
		 * @param outIsInside Set to whether `distance` falls within the run's bounds
		 */
		CharacterHit get_character_hit_from_distance(float distance, bool& outIsInside) const;

		/**
		 * Gets the caret hit one cluster further in logical order. Returns `characterHit` unchanged if no
		 * further movement is possible.
		 */
		CharacterHit get_next_caret_character_hit(CharacterHit characterHit) const;

		/**
		 * Gets the caret hit one cluster earlier in logical order. Returns `characterHit` unchanged if no
		 * further movement is possible.
		 */
		CharacterHit get_previous_caret_character_hit(CharacterHit characterHit) const;

		/**
		 * Gets the conservative bounding box of the run. Computed on first call unless bounds were supplied
		 * when the run was built.
		 */
		const Rect& get_bounds() const;

		/**
		 * Gets the platform drawable for this run, creating it on first call. Returns an invalid drawable if
		 * the run was built without drawable functions.
		 */
		const GlyphRunDrawable& get_drawable() const;

		/**
		 * Gets the advance of the glyph at `glyphIndex`, either as supplied or derived from the typeface.
		 */
		float get_glyph_advance(uint32_t glyphIndex) const;

		const std::shared_ptr<const Typeface>& get_typeface() const;
		float get_font_rendering_em_size() const;
		float get_scale() const;

		const std::vector<uint16_t>& get_glyph_indices() const;
		const std::vector<float>& get_glyph_advances() const;
		const std::vector<Vector2>& get_glyph_offsets() const;
		const std::vector<uint16_t>& get_glyph_clusters() const;
		uint32_t get_glyph_count() const;

		std::u16string_view get_characters() const;
		uint32_t get_character_start() const;
		uint32_t get_character_length() const;
		uint32_t get_character_end() const;

		uint8_t get_bidi_level() const;
		bool is_left_to_right() const;
	private:
		std::shared_ptr<const Typeface> m_typeface;
		float m_fontRenderingEmSize{};
		float m_scale{};
		std::vector<uint16_t> m_glyphIndices;
		std::vector<float> m_glyphAdvances;
		std::vector<Vector2> m_glyphOffsets;
		std::vector<uint16_t> m_glyphClusters;
		std::u16string m_characters;
		uint32_t m_characterStart{};
		uint8_t m_bidiLevel{};

		GlyphRunDrawableFunctions m_drawableFunctions{};
		mutable std::optional<Rect> m_bounds;
		mutable GlyphRunDrawable m_drawable{};
		mutable bool m_drawableRequested{};

		explicit GlyphRun(std::shared_ptr<const Typeface> typeface, float fontRenderingEmSize,
				std::vector<uint16_t> glyphIndices, std::vector<float> glyphAdvances,
				std::vector<Vector2> glyphOffsets, std::vector<uint16_t> glyphClusters, std::u16string characters,
				uint32_t characterStart, uint8_t bidiLevel, std::optional<Rect> bounds,
				const GlyphRunDrawableFunctions& drawableFunctions);

		Rect calc_bounds() const;
		float get_cluster_width(uint32_t clusterStartGlyph, uint32_t& outClusterEndGlyph) const;
		uint32_t get_cluster_character_span(uint32_t clusterStartGlyph, uint32_t clusterEndGlyph) const;
		void release_drawable();

		friend class GlyphRunBuilder;
};

}
