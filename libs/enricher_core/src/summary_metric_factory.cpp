// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/summary_metric_factory.hpp"

#include <chrono>

namespace enricher {

namespace {

constexpr uint64_t kNanosPerSecond = 1000000000ULL;

void add_label(opentelemetry::proto::metrics::v1::DoubleSummaryDataPoint* point,
               const std::string& key, const std::string& value) {
    auto* label = point->add_labels();
    label->set_key(key);
    label->set_value(value);
}

void add_quantile(opentelemetry::proto::metrics::v1::DoubleSummaryDataPoint* point,
                  double quantile, double value) {
    auto* q = point->add_quantile_values();
    q->set_quantile(quantile);
    q->set_value(value);
}

}  // namespace

uint64_t now_unix_nano_truncated() {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return static_cast<uint64_t>(seconds) * kNanosPerSecond;
}

SummaryMetricFactory::SummaryMetricFactory(const TransformConfig& config, Clock clock)
    : config_(config)
    , clock_(std::move(clock)) {
}

Metric SummaryMetricFactory::build(const std::string& function_name) const {
    const uint64_t timestamp = clock_();

    Metric metric;
    metric.set_name(kSummaryMetricName);
    metric.set_unit(kSummaryMetricUnit);

    auto* point = metric.mutable_double_summary()->add_data_points();
    add_label(point, kNamespaceLabelKey, kNamespaceLabelValue);
    add_label(point, kMetricNameLabelKey, kMetricNameLabelValue);
    add_label(point, config_.function_label_key, function_name);
    for (const auto& [key, value] : config_.custom_attributes) {
        add_label(point, key, value);
    }

    point->set_start_time_unix_nano(timestamp);
    point->set_time_unix_nano(timestamp);
    point->set_count(1);
    point->set_sum(1.0);

    // Degenerate distribution: min and max are both 1
    add_quantile(point, 0.0, 1.0);
    add_quantile(point, 1.0, 1.0);

    return metric;
}

}  // namespace enricher
