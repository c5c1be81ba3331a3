#include "string_conversion.hpp"

#include <unicode/unistr.h>

using namespace ShapedText;

std::u16string ShapedText::utf8_to_utf16(std::string_view str) {
	auto unicodeStr = icu::UnicodeString::fromUTF8(icu::StringPiece(str.data(),
			static_cast<int32_t>(str.size())));
	return std::u16string(unicodeStr.getBuffer(), static_cast<size_t>(unicodeStr.length()));
}

std::string ShapedText::utf16_to_utf8(std::u16string_view str) {
	icu::UnicodeString unicodeStr(false, str.data(), static_cast<int32_t>(str.size()));
	std::string result;
	unicodeStr.toUTF8String(result);
	return result;
}
