// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/metric_matcher.hpp"
#include "enricher/metric_shape.hpp"

#include <glog/logging.h>

#include <unordered_set>
#include <utility>

namespace enricher {

std::vector<std::string> find_scope_matches(const ScopeMetrics& scope,
                                            const TransformConfig& config) {
    std::vector<std::string> matches;
    std::unordered_set<std::string> produced;

    for (const auto& metric : scope.metrics()) {
        if (metric_shape(metric) == MetricShape::None) {
            continue;
        }

        visit_data_points(metric, [&](const auto& point) {
            for (const auto& label : point.labels()) {
                if (label.key() != config.function_label_key) {
                    continue;
                }
                if (!config.is_target(label.value()) || produced.count(label.value())) {
                    continue;
                }
                VLOG(1) << "Matched " << config.function_label_key << "=" << label.value()
                        << " in metric " << metric.name()
                        << " (" << to_string(metric_shape(metric)) << ")";
                produced.insert(label.value());
                matches.push_back(label.value());
            }
        });
    }

    return matches;
}

std::vector<ScopeMatch> find_matches(const ExportRequest& request,
                                     const TransformConfig& config) {
    std::vector<ScopeMatch> result;

    for (int r = 0; r < request.resource_metrics_size(); ++r) {
        const auto& resource = request.resource_metrics(r);
        for (int s = 0; s < resource.instrumentation_library_metrics_size(); ++s) {
            auto names = find_scope_matches(resource.instrumentation_library_metrics(s), config);
            if (names.empty()) {
                continue;
            }
            ScopeMatch match;
            match.resource_index = static_cast<size_t>(r);
            match.scope_index = static_cast<size_t>(s);
            match.function_names = std::move(names);
            result.push_back(std::move(match));
        }
    }

    return result;
}

}  // namespace enricher
