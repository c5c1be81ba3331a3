#pragma once

#include <cstdint>

#include <string_view>

namespace ShapedText {

/**
 * Resolves the paragraph embedding level of `text` from its first strongly directional character:
 * 1 for right-to-left, 0 for left-to-right, and `defaultLevel` if the text has no strong characters.
 */
uint8_t resolve_base_bidi_level(std::u16string_view text, uint8_t defaultLevel = 0);

}
