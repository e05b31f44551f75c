// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/transform_config.hpp"
#include "enricher/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <utility>

namespace enricher {

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    auto begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

// An empty YAML value ("key:") reads back as "null" through as<std::string>(),
// so nulls are mapped to the empty string and collections are rejected.
std::string scalar_string(const YAML::Node& node, const char* what) {
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsScalar()) {
        throw ConfigError(std::string(what) + " must be a scalar");
    }
    return node.as<std::string>();
}

void merge_node(const YAML::Node& root, TransformConfig& config) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    // "target_functions:" with no value leaves the list unchanged
    if (auto targets = root["target_functions"]; targets && !targets.IsNull()) {
        if (targets.IsSequence()) {
            std::set<std::string> names;
            for (const auto& item : targets) {
                auto name = trim(scalar_string(item, "target_functions entry"));
                if (!name.empty()) {
                    names.insert(name);
                }
            }
            config.target_functions = std::move(names);
        } else if (targets.IsScalar()) {
            config.target_functions = parse_function_list(targets.as<std::string>());
        } else {
            throw ConfigError("target_functions must be a list or a comma-separated string");
        }
    }

    if (auto key = root["function_label_key"]) {
        auto label_key = trim(scalar_string(key, "function_label_key"));
        if (!label_key.empty()) {
            config.function_label_key = label_key;
        }
    }

    if (auto attrs = root["attributes"]; attrs && !attrs.IsNull()) {
        if (!attrs.IsMap()) {
            throw ConfigError("attributes must be a mapping of key: value");
        }
        std::vector<Attribute> parsed;
        for (const auto& entry : attrs) {
            // A blank key or value is kept as empty, which disables augmentation
            parsed.emplace_back(scalar_string(entry.first, "attribute key"),
                                scalar_string(entry.second, "attribute value"));
        }
        config.custom_attributes = std::move(parsed);
    }
}

}  // namespace

bool TransformConfig::complete() const {
    if (target_functions.empty() || function_label_key.empty() || custom_attributes.empty()) {
        return false;
    }
    for (const auto& [key, value] : custom_attributes) {
        if (key.empty() || value.empty()) {
            return false;
        }
    }
    return true;
}

bool TransformConfig::is_target(const std::string& value) const {
    return target_functions.count(value) > 0;
}

std::set<std::string> parse_function_list(const std::string& csv) {
    std::set<std::string> names;
    std::istringstream stream(csv);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto name = trim(item);
        if (!name.empty()) {
            names.insert(name);
        }
    }
    return names;
}

TransformConfig config_from_env(const EnvLookup& lookup) {
    TransformConfig config;

    if (auto targets = lookup(kEnvTargetFunctions)) {
        config.target_functions = parse_function_list(*targets);
    }

    if (auto label_key = lookup(kEnvFunctionLabelKey)) {
        auto trimmed = trim(*label_key);
        if (!trimmed.empty()) {
            config.function_label_key = trimmed;
        }
    }

    auto key = lookup(kEnvAttributeKey);
    auto value = lookup(kEnvAttributeValue);
    if (key && value) {
        config.custom_attributes.emplace_back(*key, *value);
    }

    return config;
}

TransformConfig load_config_from_env() {
    return config_from_env([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

void merge_config_yaml(const std::string& yaml_text, TransformConfig& config) {
    try {
        merge_node(YAML::Load(yaml_text), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

void merge_config_file(const std::string& path, TransformConfig& config) {
    try {
        merge_node(YAML::LoadFile(path), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load config file " + path + ": " + e.what());
    }
}

bool apply_overrides(const ConfigOverrides& overrides, TransformConfig& config) {
    if (!overrides.target_functions.empty()) {
        config.target_functions = parse_function_list(overrides.target_functions);
    }

    auto label_key = trim(overrides.function_label_key);
    if (!label_key.empty()) {
        config.function_label_key = label_key;
    }

    const bool has_key = !overrides.attribute_key.empty();
    const bool has_value = !overrides.attribute_value.empty();
    if (has_key && has_value) {
        config.custom_attributes = {{overrides.attribute_key, overrides.attribute_value}};
    } else if (has_key || has_value) {
        return false;
    }
    return true;
}

std::string describe(const TransformConfig& config) {
    std::ostringstream out;
    out << "targets=[";
    bool first = true;
    for (const auto& name : config.target_functions) {
        out << (first ? "" : ",") << name;
        first = false;
    }
    out << "] label_key=" << config.function_label_key << " attributes={";
    first = true;
    for (const auto& [key, value] : config.custom_attributes) {
        out << (first ? "" : ",") << key << "=" << value;
        first = false;
    }
    out << "} augmentation=" << (config.complete() ? "enabled" : "disabled");
    return out.str();
}

}  // namespace enricher
