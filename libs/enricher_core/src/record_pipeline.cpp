// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/record_pipeline.hpp"
#include "enricher/metric_matcher.hpp"
#include "enricher/payload_encoding.hpp"

#include <glog/logging.h>

#include <exception>

namespace enricher {

const char* to_string(RecordResult result) {
    switch (result) {
        case RecordResult::Ok: return "Ok";
        case RecordResult::ProcessingFailed: return "ProcessingFailed";
    }
    return "ProcessingFailed";
}

RecordPipeline::RecordPipeline(const TransformConfig& config,
                               SummaryMetricFactory::Clock clock)
    : config_(config)
    , factory_(config, std::move(clock)) {
}

size_t RecordPipeline::augment(ExportRequest& request) {
    if (!config_.complete()) {
        if (!warned_incomplete_) {
            LOG(WARNING) << "Target functions or custom attribute not configured, "
                         << "passing records through without augmentation";
            warned_incomplete_ = true;
        }
        return 0;
    }

    // Scan first, append after: matches reference scopes by index and the
    // appended metrics must not be seen by the scan.
    auto matches = find_matches(request, config_);

    size_t added = 0;
    for (const auto& match : matches) {
        auto* scope = request.mutable_resource_metrics(static_cast<int>(match.resource_index))
                          ->mutable_instrumentation_library_metrics(static_cast<int>(match.scope_index));
        for (const auto& function_name : match.function_names) {
            LOG(INFO) << "Match found for '" << function_name
                      << "', adding custom summary metric";
            *scope->add_metrics() = factory_.build(function_name);
            ++added;
        }
    }

    stats_.metrics_added += added;
    return added;
}

std::vector<uint8_t> RecordPipeline::transform_payload(const std::vector<uint8_t>& payload) {
    auto requests = decode_batch(payload);
    for (auto& request : requests) {
        augment(request);
    }
    stats_.messages_processed += requests.size();
    return encode_batch(requests);
}

OutputRecord RecordPipeline::process(const InputRecord& record) {
    OutputRecord output;
    output.record_id = record.record_id;
    stats_.records_total++;

    try {
        auto payload = decode_base64_payload(record.data);
        auto transformed = transform_payload(payload);
        output.data = encode_base64_payload(transformed);
        output.result = RecordResult::Ok;
        stats_.records_ok++;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Processing failed for record " << record.record_id << ": " << e.what();
        output.result = RecordResult::ProcessingFailed;
        output.data = record.data;
        stats_.records_failed++;
    }

    return output;
}

std::vector<OutputRecord> RecordPipeline::process_all(const std::vector<InputRecord>& records) {
    std::vector<OutputRecord> outputs;
    outputs.reserve(records.size());

    const uint64_t failed_before = stats_.records_failed;
    for (const auto& record : records) {
        outputs.push_back(process(record));
    }

    LOG(INFO) << "Processed " << outputs.size() << " records"
              << " (failed=" << (stats_.records_failed - failed_before)
              << ", metrics_added=" << stats_.metrics_added << ")";
    return outputs;
}

}  // namespace enricher
