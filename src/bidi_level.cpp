#include "bidi_level.hpp"

#include <unicode/ubidi.h>

using namespace ShapedText;

uint8_t ShapedText::resolve_base_bidi_level(std::u16string_view text, uint8_t defaultLevel) {
	switch (ubidi_getBaseDirection(text.data(), static_cast<int32_t>(text.size()))) {
		case UBIDI_RTL:
			return 1;
		case UBIDI_LTR:
			return 0;
		default:
			return defaultLevel;
	}
}
