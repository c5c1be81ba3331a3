#include "metrics_typeface.hpp"

using namespace ShapedText;

MetricsTypeface::MetricsTypeface(const TypefaceMetrics& metrics, float defaultAdvance,
			std::vector<float> advances)
		: m_metrics(metrics)
		, m_defaultAdvance(defaultAdvance)
		, m_advances(std::move(advances)) {}

uint32_t MetricsTypeface::get_design_em_height() const {
	return m_metrics.designEmHeight;
}

float MetricsTypeface::get_ascent() const {
	return m_metrics.ascent;
}

float MetricsTypeface::get_descent() const {
	return m_metrics.descent;
}

float MetricsTypeface::get_line_gap() const {
	return m_metrics.lineGap;
}

float MetricsTypeface::get_glyph_advance(uint16_t glyph) const {
	return glyph < m_advances.size() ? m_advances[glyph] : m_defaultAdvance;
}
