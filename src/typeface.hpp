#pragma once

#include <cstdint>

namespace ShapedText {

/**
 * Font metrics required to measure a glyph run. All values are in font design units, using a y-down
 * convention: `get_ascent()` is negative for ink above the baseline and `get_descent()` is positive.
 */
class Typeface {
	public:
		virtual ~Typeface() = default;

		virtual uint32_t get_design_em_height() const = 0;

		virtual float get_ascent() const = 0;
		virtual float get_descent() const = 0;
		virtual float get_line_gap() const = 0;

		/**
		 * Gets the intrinsic horizontal advance of `glyph`.
		 */
		virtual float get_glyph_advance(uint16_t glyph) const = 0;
};

}
