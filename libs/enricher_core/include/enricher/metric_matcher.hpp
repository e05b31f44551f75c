// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file metric_matcher.hpp
/// @brief Finds target functions referenced by data point labels
///
/// Matching is deduplicated per instrumentation scope: within one
/// InstrumentationLibraryMetrics a function name is reported at most once,
/// however many metrics or data points carry it. The first occurrence wins
/// and determines the reported order.

#include "enricher/message_codec.hpp"
#include "enricher/transform_config.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace enricher {

/// Matched functions of one instrumentation scope
struct ScopeMatch {
    size_t resource_index = 0;   ///< Index into ExportRequest.resource_metrics
    size_t scope_index = 0;      ///< Index into ResourceMetrics.instrumentation_library_metrics
    std::vector<std::string> function_names;  ///< First-seen order, no duplicates
};

/// Find target functions within one scope
/// @return Distinct matched function names in first-seen order
std::vector<std::string> find_scope_matches(const ScopeMetrics& scope,
                                            const TransformConfig& config);

/// Find target functions across a whole request
/// @return One entry per scope with at least one match, in tree order
std::vector<ScopeMatch> find_matches(const ExportRequest& request,
                                     const TransformConfig& config);

}  // namespace enricher
