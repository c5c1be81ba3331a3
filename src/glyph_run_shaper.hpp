#pragma once

#include "glyph_run_error.hpp"

#include <cstdint>

#include <memory>
#include <string_view>

struct hb_buffer_t;

namespace ShapedText {

class FontTypeface;
class GlyphRunBuilder;

/**
 * Shapes text with HarfBuzz into the glyph data of a single run. One instance reuses its shaping buffer
 * across calls and must not be used from multiple threads at once.
 */
class GlyphRunShaper {
	public:
		explicit GlyphRunShaper();
		~GlyphRunShaper();

		GlyphRunShaper(GlyphRunShaper&&) noexcept;
		GlyphRunShaper& operator=(GlyphRunShaper&&) noexcept;

		GlyphRunShaper(const GlyphRunShaper&) = delete;
		void operator=(const GlyphRunShaper&) = delete;

		/**
		 * Shapes `text` as a single item in the direction given by the parity of `bidiLevel`, and fills
		 * `builder` with the typeface, size, characters, level and per-glyph data. Glyphs are appended in
		 * visual order, so `builder` should not already contain glyphs.
		 *
		 * @param characterStart The index of `text[0]` in the enclosing text, added to every cluster value
		 */
		[[nodiscard]] GlyphRunError shape(GlyphRunBuilder& builder, std::shared_ptr<const FontTypeface> typeface,
				float fontRenderingEmSize, std::u16string_view text, uint32_t characterStart, uint8_t bidiLevel);
	private:
		hb_buffer_t* m_buffer{};
};

}
