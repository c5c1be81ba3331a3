#pragma once

#include <string>
#include <string_view>

namespace ShapedText {

/**
 * Converts UTF-8 to UTF-16. Ill-formed sequences are replaced with U+FFFD.
 */
std::u16string utf8_to_utf16(std::string_view str);
std::string utf16_to_utf8(std::u16string_view str);

}
