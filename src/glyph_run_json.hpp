#pragma once

#include "glyph_run_error.hpp"

#include <string_view>

namespace ShapedText {

class GlyphRunBuilder;

/**
 * Fills `builder` from a JSON run description. The typeface of the run is a `MetricsTypeface` built from the
 * description's `typeface` object. If `bidi_level` is omitted it is resolved from the text.
 *
 * On failure `builder` may hold part of the description and should be cleared before reuse.
 */
[[nodiscard]] GlyphRunError load_glyph_run_from_json_data(std::string_view data, GlyphRunBuilder& builder);
[[nodiscard]] GlyphRunError load_glyph_run_from_json_file(const char* fileName, GlyphRunBuilder& builder);

}
