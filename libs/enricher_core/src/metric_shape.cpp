// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/metric_shape.hpp"

namespace enricher {

MetricShape metric_shape(const Metric& metric) {
    switch (metric.data_case()) {
        case Metric::kIntGauge: return MetricShape::IntGauge;
        case Metric::kDoubleGauge: return MetricShape::DoubleGauge;
        case Metric::kIntSum: return MetricShape::IntSum;
        case Metric::kDoubleSum: return MetricShape::DoubleSum;
        case Metric::kIntHistogram: return MetricShape::IntHistogram;
        case Metric::kDoubleHistogram: return MetricShape::DoubleHistogram;
        case Metric::kDoubleSummary: return MetricShape::DoubleSummary;
        case Metric::DATA_NOT_SET: return MetricShape::None;
    }
    return MetricShape::None;
}

const char* to_string(MetricShape shape) {
    switch (shape) {
        case MetricShape::None: return "none";
        case MetricShape::IntGauge: return "int_gauge";
        case MetricShape::DoubleGauge: return "double_gauge";
        case MetricShape::IntSum: return "int_sum";
        case MetricShape::DoubleSum: return "double_sum";
        case MetricShape::IntHistogram: return "int_histogram";
        case MetricShape::DoubleHistogram: return "double_histogram";
        case MetricShape::DoubleSummary: return "double_summary";
    }
    return "unknown";
}

}  // namespace enricher
