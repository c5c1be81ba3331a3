#pragma once

#include "typeface.hpp"

#include <vector>

namespace ShapedText {

struct TypefaceMetrics {
	uint32_t designEmHeight;
	float ascent;
	float descent;
	float lineGap;
};

/**
 * A typeface described entirely by its metrics and an advance table indexed by glyph id. Glyphs outside
 * the table use `defaultAdvance`.
 */
class MetricsTypeface final : public Typeface {
	public:
		explicit MetricsTypeface(const TypefaceMetrics& metrics, float defaultAdvance = 0.f,
				std::vector<float> advances = {});

		uint32_t get_design_em_height() const override;

		float get_ascent() const override;
		float get_descent() const override;
		float get_line_gap() const override;

		float get_glyph_advance(uint16_t glyph) const override;
	private:
		TypefaceMetrics m_metrics;
		float m_defaultAdvance;
		std::vector<float> m_advances;
};

}
