#pragma once

#include "typeface.hpp"

#include <memory>

struct FT_FaceRec_;
struct FT_LibraryRec_;
struct hb_font_t;

namespace ShapedText {

enum class TypefaceError : uint8_t {
	NONE,
	LIBRARY_INIT_FAILED,
	CANNOT_OPEN_FILE,
	INVALID_FONT_DATA,
	NO_HARFBUZZ_FONT,
};

const char* typeface_error_to_string(TypefaceError);

/**
 * A typeface loaded from a font file. FreeType owns the face data; HarfBuzz provides OpenType metrics,
 * design-unit advances and shaping through `get_hb_font()`.
 *
 * The HarfBuzz font is kept at design-unit scale, so shaping results must be multiplied by
 * `fontRenderingEmSize / get_design_em_height()`.
 */
class FontTypeface final : public Typeface {
	public:
		/**
		 * Loads face `faceIndex` of the font file at `fileName`. On success `outTypeface` holds the new
		 * typeface; otherwise it is left unchanged.
		 */
		[[nodiscard]] static TypefaceError load(const char* fileName, uint32_t faceIndex,
				std::shared_ptr<const FontTypeface>& outTypeface);

		~FontTypeface() override;

		FontTypeface(FontTypeface&&) = delete;
		void operator=(FontTypeface&&) = delete;

		FontTypeface(const FontTypeface&) = delete;
		void operator=(const FontTypeface&) = delete;

		uint32_t get_design_em_height() const override;

		float get_ascent() const override;
		float get_descent() const override;
		float get_line_gap() const override;

		float get_glyph_advance(uint16_t glyph) const override;

		hb_font_t* get_hb_font() const;
	private:
		FT_LibraryRec_* m_ftLibrary;
		FT_FaceRec_* m_ftFace;
		hb_font_t* m_hbFont;
		float m_ascent{};
		float m_descent{};
		float m_lineGap{};

		explicit FontTypeface(FT_LibraryRec_* ftLibrary, FT_FaceRec_* ftFace, hb_font_t* hbFont);
};

}
