#pragma once

#include <cstddef>
#include <cstdint>

namespace ShapedText {

template <typename Condition>
constexpr size_t binary_search(size_t first, size_t count, Condition&& cond) {
	while (count > 0) {
		auto step = count / 2;
		auto i = first + step;

		if (cond(i)) {
			first = i + 1;
			count -= step + 1;
		}
		else {
			count = step;
		}
	}

	return first;
}

/**
 * Gets the position of the first glyph of the cluster with the largest value not greater than
 * `characterIndex`, i.e. the cluster containing that character. `clusters` must be sorted in ascending
 * order, or in descending order if `descending` is set.
 *
 * Returns `count` if no such cluster exists.
 */
constexpr size_t find_containing_cluster(const uint16_t* clusters, size_t count, uint32_t characterIndex,
		bool descending) {
	auto index = binary_search(0, count, [&](auto i) {
		return descending ? clusters[i] > characterIndex : clusters[i] <= characterIndex;
	});

	if (descending) {
		// Already the first position holding the matching value
		return index;
	}

	if (index == 0) {
		return count;
	}

	--index;

	while (index > 0 && clusters[index - 1] == clusters[index]) {
		--index;
	}

	return index;
}

}
