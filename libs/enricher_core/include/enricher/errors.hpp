// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file errors.hpp
/// @brief Exception types raised by the metrics enricher
///
/// Library code throws; RecordPipeline::process() is the per-record
/// boundary that catches and converts failures into ProcessingFailed
/// results. An incomplete configuration is not an error (see
/// TransformConfig::complete()).

#include <stdexcept>
#include <string>

namespace enricher {

/// Base class for all enricher failures
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Truncated or overrunning length prefix, or leftover bytes in a stream
class FramingError : public Error {
public:
    using Error::Error;
};

/// Message body is not a valid ExportMetricsServiceRequest
class SchemaDecodeError : public Error {
public:
    using Error::Error;
};

/// Serialization of an ExportMetricsServiceRequest failed
class SchemaEncodeError : public Error {
public:
    using Error::Error;
};

/// Record payload is not valid base64
class PayloadEncodingError : public Error {
public:
    using Error::Error;
};

/// Invocation event JSON is malformed or missing required fields
class EventFormatError : public Error {
public:
    using Error::Error;
};

/// Configuration file could not be loaded
class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace enricher
