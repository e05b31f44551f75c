// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file metric_shape.hpp
/// @brief Explicit match over the Metric "data" oneof
///
/// Every branch of the oneof is named here once. Both metric_shape() and
/// visit_data_points() switch over Metric::DataCase without a default, so
/// -Wswitch flags any branch added to the schema but not handled.

#include "enricher/message_codec.hpp"

namespace enricher {

/// Populated branch of Metric.data
enum class MetricShape {
    None,
    IntGauge,
    DoubleGauge,
    IntSum,
    DoubleSum,
    IntHistogram,
    DoubleHistogram,
    DoubleSummary
};

/// Get the populated branch of a metric
MetricShape metric_shape(const Metric& metric);

/// Get string representation of a metric shape
const char* to_string(MetricShape shape);

/// Call visitor(point) for every data point of the populated branch
///
/// The visitor receives the concrete data point type of the branch
/// (IntDataPoint, DoubleDataPoint, ...), all of which expose labels().
/// Metrics with no populated branch produce no calls.
template <typename Visitor>
void visit_data_points(const Metric& metric, Visitor&& visitor) {
    switch (metric.data_case()) {
        case Metric::kIntGauge:
            for (const auto& point : metric.int_gauge().data_points()) visitor(point);
            return;
        case Metric::kDoubleGauge:
            for (const auto& point : metric.double_gauge().data_points()) visitor(point);
            return;
        case Metric::kIntSum:
            for (const auto& point : metric.int_sum().data_points()) visitor(point);
            return;
        case Metric::kDoubleSum:
            for (const auto& point : metric.double_sum().data_points()) visitor(point);
            return;
        case Metric::kIntHistogram:
            for (const auto& point : metric.int_histogram().data_points()) visitor(point);
            return;
        case Metric::kDoubleHistogram:
            for (const auto& point : metric.double_histogram().data_points()) visitor(point);
            return;
        case Metric::kDoubleSummary:
            for (const auto& point : metric.double_summary().data_points()) visitor(point);
            return;
        case Metric::DATA_NOT_SET:
            return;
    }
}

}  // namespace enricher
