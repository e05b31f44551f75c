// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/errors.hpp"
#include "enricher/firehose_event.hpp"
#include "enricher/payload_encoding.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;

namespace enricher::test {

// =============================================================================
// Event parsing
// =============================================================================

TEST(FirehoseEventTest, ParsesRecords) {
    auto event = parse_firehose_event(std::string(R"({
        "invocationId": "inv-123",
        "deliveryStreamArn": "arn:aws:firehose:us-east-1:123456789012:deliverystream/metrics",
        "region": "us-east-1",
        "records": [
            {"recordId": "1", "approximateArrivalTimestamp": 1700000000000, "data": "AA=="},
            {"recordId": "2", "data": ""}
        ]
    })"));

    EXPECT_EQ(event.invocation_id, "inv-123");
    EXPECT_EQ(event.region, "us-east-1");
    EXPECT_NE(event.delivery_stream_arn.find("deliverystream/metrics"), std::string::npos);
    ASSERT_EQ(event.records.size(), 2u);
    EXPECT_EQ(event.records[0].record_id, "1");
    EXPECT_EQ(event.records[0].data, "AA==");
    EXPECT_EQ(event.records[1].record_id, "2");
    EXPECT_EQ(event.records[1].data, "");
}

TEST(FirehoseEventTest, EmptyRecordList) {
    auto event = parse_firehose_event(std::string(R"({"records": []})"));
    EXPECT_TRUE(event.records.empty());
    EXPECT_TRUE(event.invocation_id.empty());
}

TEST(FirehoseEventTest, RejectsMalformedEvents) {
    EXPECT_THROW(parse_firehose_event(std::string("{not json")), EventFormatError);
    EXPECT_THROW(parse_firehose_event(std::string("[]")), EventFormatError);
    EXPECT_THROW(parse_firehose_event(std::string(R"({"invocationId": "x"})")), EventFormatError);
    EXPECT_THROW(parse_firehose_event(std::string(R"({"records": {}})")), EventFormatError);
    EXPECT_THROW(parse_firehose_event(std::string(R"({"records": [1]})")), EventFormatError);
    EXPECT_THROW(parse_firehose_event(std::string(R"({"records": [{"recordId": "1"}]})")),
                 EventFormatError);
    EXPECT_THROW(parse_firehose_event(std::string(R"({"records": [{"recordId": 7, "data": ""}]})")),
                 EventFormatError);
}

TEST(FirehoseEventTest, ParsesFromJsonDocument) {
    json j = {{"records", json::array({{{"recordId", "a"}, {"data", "Zm9v"}}})}};
    auto event = parse_firehose_event(j);
    ASSERT_EQ(event.records.size(), 1u);
    EXPECT_EQ(event.records[0].data, "Zm9v");
}

// =============================================================================
// Response
// =============================================================================

TEST(FirehoseEventTest, ResponseShape) {
    std::vector<OutputRecord> outputs = {
        {"1", RecordResult::Ok, "AA=="},
        {"2", RecordResult::ProcessingFailed, "@@"}
    };

    auto j = to_response_json(outputs);
    ASSERT_TRUE(j["records"].is_array());
    ASSERT_EQ(j["records"].size(), 2u);
    EXPECT_EQ(j["records"][0]["recordId"], "1");
    EXPECT_EQ(j["records"][0]["result"], "Ok");
    EXPECT_EQ(j["records"][0]["data"], "AA==");
    EXPECT_EQ(j["records"][1]["result"], "ProcessingFailed");
    EXPECT_EQ(j["records"][1]["data"], "@@");
}

TEST(FirehoseEventTest, EmptyResponse) {
    EXPECT_EQ(serialize_firehose_response({}), R"({"records":[]})");
}

TEST(FirehoseEventTest, InvocationRoundTrip) {
    auto config = make_config({"f1"});
    RecordPipeline pipeline(config, [] { return kFixedTimeNanos; });

    auto data = encode_base64_payload(encode_batch({make_request({{make_lambda_summary("Duration", "f1")}})}));
    json event = {{"records", json::array({
        {{"recordId", "ok"}, {"data", data}},
        {{"recordId", "bad"}, {"data", "AQ=="}}   // length 1, no body
    })}};

    auto outputs = pipeline.process_all(parse_firehose_event(event).records);
    auto response = json::parse(serialize_firehose_response(outputs));

    ASSERT_EQ(response["records"].size(), 2u);
    EXPECT_EQ(response["records"][0]["recordId"], "ok");
    EXPECT_EQ(response["records"][0]["result"], "Ok");
    EXPECT_NE(response["records"][0]["data"].get<std::string>(), data);
    EXPECT_EQ(response["records"][1]["recordId"], "bad");
    EXPECT_EQ(response["records"][1]["result"], "ProcessingFailed");
    EXPECT_EQ(response["records"][1]["data"], "AQ==");
}

}  // namespace enricher::test
