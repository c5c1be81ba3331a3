#include "font_typeface.hpp"

#include "common.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>
#include <hb-ot.h>

using namespace ShapedText;

const char* ShapedText::typeface_error_to_string(TypefaceError error) {
	switch (error) {
		case TypefaceError::NONE:
			return "NONE";
		case TypefaceError::LIBRARY_INIT_FAILED:
			return "LIBRARY_INIT_FAILED";
		case TypefaceError::CANNOT_OPEN_FILE:
			return "CANNOT_OPEN_FILE";
		case TypefaceError::INVALID_FONT_DATA:
			return "INVALID_FONT_DATA";
		case TypefaceError::NO_HARFBUZZ_FONT:
			return "NO_HARFBUZZ_FONT";
	}

	SHAPEDTEXT_UNREACHABLE();
}

TypefaceError FontTypeface::load(const char* fileName, uint32_t faceIndex,
		std::shared_ptr<const FontTypeface>& outTypeface) {
	FT_Library ftLibrary;
	if (FT_Init_FreeType(&ftLibrary) != 0) {
		return TypefaceError::LIBRARY_INIT_FAILED;
	}

	FT_Face ftFace;
	if (auto err = FT_New_Face(ftLibrary, fileName, static_cast<FT_Long>(faceIndex), &ftFace); err != 0) {
		FT_Done_FreeType(ftLibrary);
		return err == FT_Err_Cannot_Open_Resource ? TypefaceError::CANNOT_OPEN_FILE
				: TypefaceError::INVALID_FONT_DATA;
	}

	// Bitmap-only faces have no design units to measure in
	if (ftFace->units_per_EM == 0) {
		FT_Done_Face(ftFace);
		FT_Done_FreeType(ftLibrary);
		return TypefaceError::INVALID_FONT_DATA;
	}

	hb_face_t* hbFace = hb_ft_face_create_referenced(ftFace);
	hb_font_t* hbFont = hb_font_create(hbFace);
	hb_face_destroy(hbFace);

	if (hbFont == hb_font_get_empty()) {
		FT_Done_Face(ftFace);
		FT_Done_FreeType(ftLibrary);
		return TypefaceError::NO_HARFBUZZ_FONT;
	}

	outTypeface = std::shared_ptr<const FontTypeface>(new FontTypeface(ftLibrary, ftFace, hbFont));

	return TypefaceError::NONE;
}

FontTypeface::FontTypeface(FT_LibraryRec_* ftLibrary, FT_FaceRec_* ftFace, hb_font_t* hbFont)
		: m_ftLibrary(ftLibrary)
		, m_ftFace(ftFace)
		, m_hbFont(hbFont) {
	hb_position_t ascender;
	hb_position_t descender;
	hb_position_t lineGap;

	if (!hb_ot_metrics_get_position(m_hbFont, HB_OT_METRICS_TAG_HORIZONTAL_ASCENDER, &ascender)) {
		ascender = m_ftFace->ascender;
	}

	if (!hb_ot_metrics_get_position(m_hbFont, HB_OT_METRICS_TAG_HORIZONTAL_DESCENDER, &descender)) {
		descender = m_ftFace->descender;
	}

	if (!hb_ot_metrics_get_position(m_hbFont, HB_OT_METRICS_TAG_HORIZONTAL_LINE_GAP, &lineGap)) {
		lineGap = m_ftFace->height - (m_ftFace->ascender - m_ftFace->descender);
	}

	// Font tables are y-up
	m_ascent = -static_cast<float>(ascender);
	m_descent = -static_cast<float>(descender);
	m_lineGap = static_cast<float>(lineGap);
}

FontTypeface::~FontTypeface() {
	hb_font_destroy(m_hbFont);
	FT_Done_Face(m_ftFace);
	FT_Done_FreeType(m_ftLibrary);
}

uint32_t FontTypeface::get_design_em_height() const {
	return m_ftFace->units_per_EM;
}

float FontTypeface::get_ascent() const {
	return m_ascent;
}

float FontTypeface::get_descent() const {
	return m_descent;
}

float FontTypeface::get_line_gap() const {
	return m_lineGap;
}

float FontTypeface::get_glyph_advance(uint16_t glyph) const {
	return static_cast<float>(hb_font_get_glyph_h_advance(m_hbFont, glyph));
}

hb_font_t* FontTypeface::get_hb_font() const {
	return m_hbFont;
}
