#pragma once

#include "glyph_run.hpp"
#include "glyph_run_error.hpp"

namespace ShapedText {

/**
 * Collects the shaped data of a single run and validates it into an immutable `GlyphRun`.
 *
 * Glyph data may be supplied either as whole arrays through the `set_*` functions or glyph by glyph with
 * `append_glyph`. Advances and offsets are optional: leave them empty to derive advances from the typeface
 * and to draw every glyph at its pen position.
 */
class GlyphRunBuilder {
	public:
		void set_typeface(std::shared_ptr<const Typeface> typeface);
		void set_font_rendering_em_size(float fontRenderingEmSize);
		void set_glyph_indices(std::vector<uint16_t> glyphIndices);
		void set_glyph_advances(std::vector<float> glyphAdvances);
		void set_glyph_offsets(std::vector<Vector2> glyphOffsets);
		void set_glyph_clusters(std::vector<uint16_t> glyphClusters);
		/**
		 * Sets the source text of the run. `characterStart` is the index of `characters[0]` within the text
		 * the cluster values refer to.
		 */
		void set_characters(std::u16string characters, uint32_t characterStart = 0);
		void set_bidi_level(uint8_t bidiLevel);
		/**
		 * Supplies precomputed bounds, skipping their derivation from the glyph advances.
		 */
		void set_bounds(const Rect& bounds);
		void set_drawable_functions(const GlyphRunDrawableFunctions& funcs);

		void append_glyph(uint16_t glyph, uint16_t cluster, float advance, Vector2 offset);
		void reserve_glyphs(size_t glyphCount);

		/**
		 * Validates the collected data and on success moves it into `outGlyphRun`, leaving the builder
		 * empty. On failure the builder and `outGlyphRun` are left unchanged.
		 */
		[[nodiscard]] GlyphRunError build(std::optional<GlyphRun>& outGlyphRun);

		void clear();
	private:
		std::shared_ptr<const Typeface> m_typeface;
		float m_fontRenderingEmSize{};
		std::vector<uint16_t> m_glyphIndices;
		std::vector<float> m_glyphAdvances;
		std::vector<Vector2> m_glyphOffsets;
		std::vector<uint16_t> m_glyphClusters;
		std::u16string m_characters;
		uint32_t m_characterStart{};
		uint8_t m_bidiLevel{};
		std::optional<Rect> m_bounds;
		GlyphRunDrawableFunctions m_drawableFunctions{};

		GlyphRunError validate() const;
};

}
