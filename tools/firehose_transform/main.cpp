// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief Firehose Transform - enriches Lambda metric stream records
///
/// Reads one delivery stream data-transformation event (JSON), appends a
/// custom summary metric for every target Lambda function found in the
/// OTLP v0.7.0 metric batches, and writes the transformation response.
///
/// Configuration comes from the environment (TARGET_FUNCTION_NAMES,
/// ATTRIBUTE_KEY, ATTRIBUTE_VALUE), optionally overridden by a YAML file
/// and then by flags.
///
/// Usage:
///   firehose_transform [--event FILE|-] [--output FILE|-] [--config FILE]

#include "enricher/errors.hpp"
#include "enricher/firehose_event.hpp"
#include "enricher/record_pipeline.hpp"
#include "enricher/transform_config.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

DEFINE_string(event, "-", "Transformation event JSON file ('-' for stdin)");
DEFINE_string(output, "-", "Response JSON file ('-' for stdout)");
DEFINE_string(config, "", "YAML configuration file (overrides environment)");
DEFINE_string(target_functions, "", "Comma-separated target function names (overrides config)");
DEFINE_string(function_label_key, "", "Label key naming the function (overrides config)");
DEFINE_string(attribute_key, "", "Custom attribute key (overrides config, needs --attribute_value)");
DEFINE_string(attribute_value, "", "Custom attribute value (overrides config, needs --attribute_key)");
DEFINE_bool(pretty, false, "Indent the response JSON");

namespace {

bool read_input(const std::string& path, std::string& out) {
    if (path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG(ERROR) << "Cannot open event file " << path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

bool write_output(const std::string& path, const std::string& text) {
    if (path == "-") {
        std::cout << text << "\n";
        return static_cast<bool>(std::cout);
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        LOG(ERROR) << "Cannot open output file " << path;
        return false;
    }
    file << text << "\n";
    return static_cast<bool>(file);
}

enricher::TransformConfig build_config() {
    auto config = enricher::load_config_from_env();

    if (!FLAGS_config.empty()) {
        enricher::merge_config_file(FLAGS_config, config);
        LOG(INFO) << "Loaded configuration from " << FLAGS_config;
    }

    enricher::ConfigOverrides overrides;
    overrides.target_functions = FLAGS_target_functions;
    overrides.function_label_key = FLAGS_function_label_key;
    overrides.attribute_key = FLAGS_attribute_key;
    overrides.attribute_value = FLAGS_attribute_value;
    if (!enricher::apply_overrides(overrides, config)) {
        LOG(WARNING) << "--attribute_key and --attribute_value must be given together, ignoring";
    }

    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    gflags::SetUsageMessage("Firehose Transform - adds custom summary metrics to Lambda metric streams");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    try {
        const enricher::TransformConfig config = build_config();
        LOG(INFO) << "Configuration: " << enricher::describe(config);

        std::string event_text;
        if (!read_input(FLAGS_event, event_text)) {
            return 1;
        }

        auto event = enricher::parse_firehose_event(event_text);
        LOG(INFO) << "Invocation " << (event.invocation_id.empty() ? "<none>" : event.invocation_id)
                  << ": " << event.records.size() << " records";

        enricher::RecordPipeline pipeline(config);
        auto outputs = pipeline.process_all(event.records);

        const auto& stats = pipeline.stats();
        LOG(INFO) << "Successfully processed " << outputs.size() << " records"
                  << " (ok=" << stats.records_ok
                  << ", failed=" << stats.records_failed
                  << ", messages=" << stats.messages_processed
                  << ", metrics_added=" << stats.metrics_added << ")";

        if (!write_output(FLAGS_output,
                          enricher::serialize_firehose_response(outputs, FLAGS_pretty ? 2 : -1))) {
            LOG(ERROR) << "Failed to write response";
            return 1;
        }
    } catch (const enricher::Error& e) {
        LOG(ERROR) << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Fatal error: " << e.what();
        return 1;
    }

    gflags::ShutDownCommandLineFlags();
    google::ShutdownGoogleLogging();
    return 0;
}
