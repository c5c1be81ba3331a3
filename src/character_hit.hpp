#pragma once

#include <cstdint>

namespace ShapedText {

/**
 * A caret position within a run. `trailingLength == 0` denotes the leading edge of the cluster starting at
 * `firstCharacterIndex`; a non-zero value denotes its trailing edge, `trailingLength` code units further on.
 */
struct CharacterHit {
	uint32_t firstCharacterIndex;
	uint32_t trailingLength;

	constexpr CharacterHit get_leading_edge() const {
		return {firstCharacterIndex, 0};
	}

	constexpr uint32_t get_caret_index() const {
		return firstCharacterIndex + trailingLength;
	}

	constexpr bool is_trailing() const {
		return trailingLength != 0;
	}

	constexpr bool operator==(const CharacterHit& other) const {
		return firstCharacterIndex == other.firstCharacterIndex && trailingLength == other.trailingLength;
	}

	constexpr bool operator!=(const CharacterHit& other) const {
		return !(*this == other);
	}
};

}
