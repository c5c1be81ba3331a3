#pragma once

#include <cstdint>

namespace ShapedText {

enum class GlyphRunError : uint8_t {
	NONE,
	NO_TYPEFACE,
	INVALID_TYPEFACE_METRICS,
	INVALID_EM_SIZE,
	NO_GLYPHS,
	ADVANCE_COUNT_MISMATCH,
	OFFSET_COUNT_MISMATCH,
	CLUSTER_COUNT_MISMATCH,
	CLUSTER_OUT_OF_RANGE,
	CLUSTERS_NOT_MONOTONIC,
	SHAPING_FAILED,
	FILE_NOT_FOUND,
	INVALID_JSON,
};

const char* glyph_run_error_to_string(GlyphRunError);

}
