// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file summary_metric_factory.hpp
/// @brief Builds the synthetic summary metric that carries custom attributes
///
/// The metric mimics the shape of the AWS/Lambda metrics delivered by
/// CloudWatch metric streams so that downstream consumers ingest it like any
/// other Lambda metric. Its values are constant placeholders:
///
///   name  = "amazonaws.com/AWS/Lambda/Custom", unit = "{Count}"
///   count = 1, sum = 1.0, quantiles {0.0: 1.0, 1.0: 1.0}
///   labels: Namespace=AWS/Lambda, MetricName=Custom,
///           <function label key>=<function>, <custom attributes...>

#include "enricher/message_codec.hpp"
#include "enricher/transform_config.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace enricher {

/// @name Synthetic metric constants
/// @{
inline constexpr const char* kSummaryMetricName = "amazonaws.com/AWS/Lambda/Custom";
inline constexpr const char* kSummaryMetricUnit = "{Count}";
inline constexpr const char* kNamespaceLabelKey = "Namespace";
inline constexpr const char* kNamespaceLabelValue = "AWS/Lambda";
inline constexpr const char* kMetricNameLabelKey = "MetricName";
inline constexpr const char* kMetricNameLabelValue = "Custom";
/// @}

/// Current wall-clock time truncated to whole seconds, in nanoseconds
uint64_t now_unix_nano_truncated();

/// Factory for synthetic summary metrics
///
/// Example:
/// @code
///   SummaryMetricFactory factory(config);
///   *scope->add_metrics() = factory.build("my-function");
/// @endcode
class SummaryMetricFactory {
public:
    /// Timestamp source, nanoseconds since epoch
    using Clock = std::function<uint64_t()>;

    /// @param config Supplies the function label key and custom attributes;
    ///               must outlive the factory
    /// @param clock Timestamp source (default: now_unix_nano_truncated)
    explicit SummaryMetricFactory(const TransformConfig& config,
                                  Clock clock = now_unix_nano_truncated);

    /// Build one synthetic metric for a matched function
    Metric build(const std::string& function_name) const;

private:
    const TransformConfig& config_;
    Clock clock_;
};

}  // namespace enricher
