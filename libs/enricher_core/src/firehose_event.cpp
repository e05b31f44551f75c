// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/firehose_event.hpp"
#include "enricher/errors.hpp"

using json = nlohmann::json;

namespace enricher {

namespace {

std::string optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::string required_string(const json& record, const char* key, size_t index) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        throw EventFormatError("Record " + std::to_string(index) +
                               " is missing string field '" + key + "'");
    }
    return it->get<std::string>();
}

}  // namespace

FirehoseEvent parse_firehose_event(const json& j) {
    if (!j.is_object()) {
        throw EventFormatError("Event must be a JSON object");
    }

    auto records = j.find("records");
    if (records == j.end() || !records->is_array()) {
        throw EventFormatError("Event has no 'records' array");
    }

    FirehoseEvent event;
    event.invocation_id = optional_string(j, "invocationId");
    event.delivery_stream_arn = optional_string(j, "deliveryStreamArn");
    event.region = optional_string(j, "region");

    event.records.reserve(records->size());
    size_t index = 0;
    for (const auto& item : *records) {
        if (!item.is_object()) {
            throw EventFormatError("Record " + std::to_string(index) + " is not an object");
        }
        InputRecord record;
        record.record_id = required_string(item, "recordId", index);
        record.data = required_string(item, "data", index);
        event.records.push_back(std::move(record));
        ++index;
    }

    return event;
}

FirehoseEvent parse_firehose_event(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw EventFormatError(std::string("Event is not valid JSON: ") + e.what());
    }
    return parse_firehose_event(j);
}

json to_response_json(const std::vector<OutputRecord>& outputs) {
    json records = json::array();
    for (const auto& output : outputs) {
        records.push_back({
            {"recordId", output.record_id},
            {"result", to_string(output.result)},
            {"data", output.data}
        });
    }
    return json{{"records", records}};
}

std::string serialize_firehose_response(const std::vector<OutputRecord>& outputs, int indent) {
    return to_response_json(outputs).dump(indent);
}

}  // namespace enricher
