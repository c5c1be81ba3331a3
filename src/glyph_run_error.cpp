#include "glyph_run_error.hpp"

#include "common.hpp"

using namespace ShapedText;

const char* ShapedText::glyph_run_error_to_string(GlyphRunError error) {
	switch (error) {
		case GlyphRunError::NONE:
			return "NONE";
		case GlyphRunError::NO_TYPEFACE:
			return "NO_TYPEFACE";
		case GlyphRunError::INVALID_TYPEFACE_METRICS:
			return "INVALID_TYPEFACE_METRICS";
		case GlyphRunError::INVALID_EM_SIZE:
			return "INVALID_EM_SIZE";
		case GlyphRunError::NO_GLYPHS:
			return "NO_GLYPHS";
		case GlyphRunError::ADVANCE_COUNT_MISMATCH:
			return "ADVANCE_COUNT_MISMATCH";
		case GlyphRunError::OFFSET_COUNT_MISMATCH:
			return "OFFSET_COUNT_MISMATCH";
		case GlyphRunError::CLUSTER_COUNT_MISMATCH:
			return "CLUSTER_COUNT_MISMATCH";
		case GlyphRunError::CLUSTER_OUT_OF_RANGE:
			return "CLUSTER_OUT_OF_RANGE";
		case GlyphRunError::CLUSTERS_NOT_MONOTONIC:
			return "CLUSTERS_NOT_MONOTONIC";
		case GlyphRunError::SHAPING_FAILED:
			return "SHAPING_FAILED";
		case GlyphRunError::FILE_NOT_FOUND:
			return "FILE_NOT_FOUND";
		case GlyphRunError::INVALID_JSON:
			return "INVALID_JSON";
	}

	SHAPEDTEXT_UNREACHABLE();
}
