// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief OTLP Stream Dump - decodes a length-prefixed metrics stream
///
/// Debugging tool for delivery stream payloads. Splits the input into
/// frames, decodes each as an OTLP v0.7.0 ExportMetricsServiceRequest and
/// prints it as JSON together with a per-message shape summary.
///
/// Usage:
///   otlp_stream_dump [--input FILE|-] [--base64]

#include "enricher/errors.hpp"
#include "enricher/message_codec.hpp"
#include "enricher/metric_shape.hpp"
#include "enricher/payload_encoding.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

DEFINE_string(input, "-", "Framed stream file ('-' for stdin)");
DEFINE_bool(base64, false, "Input is base64 text (as found in record data)");
DEFINE_bool(summary_only, false, "Print only the per-message summary");

using namespace enricher;

namespace {

bool read_input(const std::string& path, std::string& out) {
    if (path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG(ERROR) << "Cannot open " << path;
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

void print_summary(size_t index, const ExportRequest& request) {
    size_t scopes = 0;
    size_t metrics = 0;
    std::map<std::string, size_t> by_shape;

    for (const auto& resource : request.resource_metrics()) {
        for (const auto& scope : resource.instrumentation_library_metrics()) {
            ++scopes;
            for (const auto& metric : scope.metrics()) {
                ++metrics;
                by_shape[to_string(metric_shape(metric))]++;
            }
        }
    }

    std::cout << "=== Message " << index << " ===\n"
              << "Resources: " << request.resource_metrics_size()
              << " | Scopes: " << scopes
              << " | Metrics: " << metrics << "\n";
    for (const auto& [shape, count] : by_shape) {
        std::cout << "  " << shape << ": " << count << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    gflags::SetUsageMessage("OTLP Stream Dump - prints length-prefixed OTLP metric batches");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    std::string raw;
    if (!read_input(FLAGS_input, raw)) {
        return 1;
    }

    try {
        std::vector<uint8_t> payload;
        if (FLAGS_base64) {
            // Tolerate a trailing newline from shell pipelines
            while (!raw.empty() && (raw.back() == '\n' || raw.back() == '\r')) {
                raw.pop_back();
            }
            payload = decode_base64_payload(raw);
        } else {
            payload.assign(raw.begin(), raw.end());
        }

        auto requests = decode_batch(payload);

        google::protobuf::util::JsonPrintOptions options;
        options.add_whitespace = true;
        options.preserve_proto_field_names = true;

        for (size_t i = 0; i < requests.size(); ++i) {
            print_summary(i, requests[i]);
            if (FLAGS_summary_only) {
                continue;
            }
            std::string json;
            auto status = google::protobuf::util::MessageToJsonString(requests[i], &json, options);
            if (!status.ok()) {
                LOG(ERROR) << "JSON conversion failed for message " << i << ": " << status.ToString();
                return 1;
            }
            std::cout << json << "\n";
        }

        LOG(INFO) << "Decoded " << requests.size() << " messages from " << payload.size() << " bytes";
    } catch (const Error& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    return 0;
}
