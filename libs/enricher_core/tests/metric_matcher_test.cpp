// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/metric_matcher.hpp"
#include "enricher/metric_shape.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace enricher::test {

using Names = std::vector<std::string>;

class MetricMatcherTest : public ::testing::Test {
protected:
    TransformConfig config_ = make_config({"f1", "f2"});
};

// =============================================================================
// Metric shapes
// =============================================================================

TEST(MetricShapeTest, ReportsPopulatedBranch) {
    Metric metric;
    EXPECT_EQ(metric_shape(metric), MetricShape::None);

    metric.mutable_int_gauge();
    EXPECT_EQ(metric_shape(metric), MetricShape::IntGauge);
    metric.mutable_double_sum();
    EXPECT_EQ(metric_shape(metric), MetricShape::DoubleSum);
    metric.mutable_double_summary();
    EXPECT_EQ(metric_shape(metric), MetricShape::DoubleSummary);
}

TEST(MetricShapeTest, ToString) {
    EXPECT_STREQ(to_string(MetricShape::None), "none");
    EXPECT_STREQ(to_string(MetricShape::IntHistogram), "int_histogram");
    EXPECT_STREQ(to_string(MetricShape::DoubleSummary), "double_summary");
}

TEST(MetricShapeTest, VisitDataPointsSkipsUnsetMetric) {
    Metric metric;
    metric.set_name("empty");
    int calls = 0;
    visit_data_points(metric, [&](const auto&) { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST(MetricShapeTest, VisitDataPointsVisitsEveryPoint) {
    auto metric = make_multi_point_gauge("g", {Labels{{"a", "1"}}, Labels{{"a", "2"}}, Labels{}});
    int calls = 0;
    size_t labels = 0;
    visit_data_points(metric, [&](const auto& point) {
        ++calls;
        labels += static_cast<size_t>(point.labels_size());
    });
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(labels, 2u);
}

// =============================================================================
// Scope matching
// =============================================================================

TEST_F(MetricMatcherTest, MatchesTargetLabel) {
    auto request = make_request({{make_gauge("cpu", {{"FunctionName", "f1"}})}});
    EXPECT_EQ(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0), config_),
              (Names{"f1"}));
}

TEST_F(MetricMatcherTest, IgnoresNonTargetValue) {
    auto request = make_request({{make_gauge("cpu", {{"FunctionName", "other"}})}});
    EXPECT_TRUE(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0),
                                   config_).empty());
}

TEST_F(MetricMatcherTest, IgnoresOtherLabelKeys) {
    auto request = make_request({{make_gauge("cpu", {{"functionname", "f1"}, {"Resource", "f2"}})}});
    EXPECT_TRUE(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0),
                                   config_).empty());
}

TEST_F(MetricMatcherTest, DeduplicatesWithinScope) {
    auto request = make_request({{
        make_multi_point_gauge("a", {Labels{{"FunctionName", "f1"}},
                                     Labels{{"FunctionName", "f1"}},
                                     Labels{{"FunctionName", "f1"}}}),
        make_lambda_summary("Duration", "f1"),
        make_lambda_summary("Invocations", "f1")
    }});
    EXPECT_EQ(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0), config_),
              (Names{"f1"}));
}

TEST_F(MetricMatcherTest, FirstSeenOrder) {
    auto request = make_request({{
        make_lambda_summary("Duration", "f2"),
        make_lambda_summary("Duration", "f1"),
        make_lambda_summary("Errors", "f2")
    }});
    EXPECT_EQ(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0), config_),
              (Names{"f2", "f1"}));
}

TEST_F(MetricMatcherTest, DuplicateKeysInOnePointAllExamined) {
    auto request = make_request({{make_gauge("dup", {{"FunctionName", "f1"},
                                                     {"FunctionName", "f2"},
                                                     {"FunctionName", "f1"}})}});
    EXPECT_EQ(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0), config_),
              (Names{"f1", "f2"}));
}

TEST_F(MetricMatcherTest, SkipsMetricsWithoutData) {
    Metric bare;
    bare.set_name("no-data");
    auto request = make_request({{bare, make_gauge("cpu", {{"FunctionName", "f2"}})}});
    EXPECT_EQ(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0), config_),
              (Names{"f2"}));
}

TEST_F(MetricMatcherTest, MatchesEveryMetricShape) {
    auto config = make_config({"ig", "dg", "is", "ds", "ih", "dh", "sm"});

    auto label = [](auto* point, const char* function) {
        auto* l = point->add_labels();
        l->set_key("FunctionName");
        l->set_value(function);
    };

    Metric int_gauge, double_gauge, int_sum, double_sum, int_hist, double_hist, summary;
    label(int_gauge.mutable_int_gauge()->add_data_points(), "ig");
    label(double_gauge.mutable_double_gauge()->add_data_points(), "dg");
    label(int_sum.mutable_int_sum()->add_data_points(), "is");
    label(double_sum.mutable_double_sum()->add_data_points(), "ds");
    label(int_hist.mutable_int_histogram()->add_data_points(), "ih");
    label(double_hist.mutable_double_histogram()->add_data_points(), "dh");
    label(summary.mutable_double_summary()->add_data_points(), "sm");

    auto request = make_request({{int_gauge, double_gauge, int_sum, double_sum,
                                  int_hist, double_hist, summary}});
    EXPECT_EQ(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0), config),
              (Names{"ig", "dg", "is", "ds", "ih", "dh", "sm"}));
}

TEST_F(MetricMatcherTest, CustomLabelKey) {
    config_.function_label_key = "Function";
    auto request = make_request({{make_gauge("cpu", {{"FunctionName", "f1"}, {"Function", "f2"}})}});
    EXPECT_EQ(find_scope_matches(request.resource_metrics(0).instrumentation_library_metrics(0), config_),
              (Names{"f2"}));
}

// =============================================================================
// Request matching
// =============================================================================

TEST_F(MetricMatcherTest, DedupIsPerScope) {
    auto request = make_request({
        {make_lambda_summary("Duration", "f1")},
        {make_lambda_summary("Duration", "f1")}
    });

    auto matches = find_matches(request, config_);
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].resource_index, 0u);
    EXPECT_EQ(matches[0].scope_index, 0u);
    EXPECT_EQ(matches[0].function_names, (Names{"f1"}));
    EXPECT_EQ(matches[1].scope_index, 1u);
    EXPECT_EQ(matches[1].function_names, (Names{"f1"}));
}

TEST_F(MetricMatcherTest, ReportsOnlyMatchingScopes) {
    auto request = make_request({
        {make_lambda_summary("Duration", "unrelated")},
        {}
    });
    auto* second = request.add_resource_metrics()->add_instrumentation_library_metrics();
    *second->add_metrics() = make_lambda_summary("Errors", "f2");

    auto matches = find_matches(request, config_);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].resource_index, 1u);
    EXPECT_EQ(matches[0].scope_index, 0u);
    EXPECT_EQ(matches[0].function_names, (Names{"f2"}));
}

TEST_F(MetricMatcherTest, EmptyRequest) {
    EXPECT_TRUE(find_matches(ExportRequest{}, config_).empty());
}

}  // namespace enricher::test
