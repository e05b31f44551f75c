// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file transform_config.hpp
/// @brief Configuration for the metrics enricher
///
/// Built once at startup from, in increasing precedence:
/// - Environment (TARGET_FUNCTION_NAMES, ATTRIBUTE_KEY, ATTRIBUTE_VALUE,
///   FUNCTION_NAME_LABEL_KEY)
/// - YAML config file
/// - Command-line overrides (apply_overrides)
///
/// The resulting value is treated as read-only and passed by const
/// reference into the pipeline.

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace enricher {

/// Label key that identifies a Lambda function in CloudWatch metric streams
inline constexpr const char* kDefaultFunctionLabelKey = "FunctionName";

/// @name Environment variable names
/// @{
inline constexpr const char* kEnvTargetFunctions = "TARGET_FUNCTION_NAMES";
inline constexpr const char* kEnvAttributeKey = "ATTRIBUTE_KEY";
inline constexpr const char* kEnvAttributeValue = "ATTRIBUTE_VALUE";
inline constexpr const char* kEnvFunctionLabelKey = "FUNCTION_NAME_LABEL_KEY";
/// @}

/// Custom attribute stamped onto every synthetic metric
using Attribute = std::pair<std::string, std::string>;

struct TransformConfig {
    /// Function names to match (label values)
    std::set<std::string> target_functions;

    /// Label key whose value names the function
    std::string function_label_key = kDefaultFunctionLabelKey;

    /// Attributes appended, in order, to every synthetic metric
    std::vector<Attribute> custom_attributes;

    /// True when augmentation can run: at least one target, a label key,
    /// and at least one attribute with non-empty key and value.
    /// When false the pipeline passes records through unchanged.
    bool complete() const;

    /// Check if a label value is one of the target functions
    bool is_target(const std::string& value) const;
};

/// Parse a comma-separated function list
///
/// Whitespace around each name is trimmed and empty entries are dropped,
/// so " f1, ,f2 " yields {f1, f2}.
std::set<std::string> parse_function_list(const std::string& csv);

/// Environment lookup; returns nullopt when a variable is unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Build a configuration from an environment lookup
TransformConfig config_from_env(const EnvLookup& lookup);

/// Build a configuration from the process environment
TransformConfig load_config_from_env();

/// Merge YAML configuration text into config
///
/// Recognized keys (each optional, each replaces the current value):
/// @code
///   target_functions: [f1, f2]     # or "f1, f2"
///   function_label_key: FunctionName
///   attributes:
///     env: prod
/// @endcode
/// A key given without a value is treated as absent, except inside
/// `attributes` where a blank key or value leaves the config incomplete.
/// @throws ConfigError on invalid YAML or wrongly typed keys
void merge_config_yaml(const std::string& yaml_text, TransformConfig& config);

/// Merge a YAML configuration file into config
/// @throws ConfigError if the file cannot be read or parsed
void merge_config_file(const std::string& path, TransformConfig& config);

/// Overrides taken from the command line; empty fields are not set
struct ConfigOverrides {
    std::string target_functions;    ///< Comma-separated, replaces the target list
    std::string function_label_key;
    std::string attribute_key;       ///< Only applied together with attribute_value
    std::string attribute_value;
};

/// Apply command-line overrides on top of config
///
/// A lone attribute key or value is ignored and the existing attributes
/// are kept.
/// @return false if a half-given attribute pair was ignored
bool apply_overrides(const ConfigOverrides& overrides, TransformConfig& config);

/// One-line summary for startup logging
std::string describe(const TransformConfig& config);

}  // namespace enricher
