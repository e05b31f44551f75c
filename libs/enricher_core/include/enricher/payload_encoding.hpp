// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file payload_encoding.hpp
/// @brief Base64 wrapping of delivery stream record payloads

#include <cstdint>
#include <string>
#include <vector>

namespace enricher {

/// Decode a base64 record payload (standard alphabet, padding optional)
/// @throws PayloadEncodingError if the text is not valid base64
std::vector<uint8_t> decode_base64_payload(const std::string& text);

/// Encode bytes as padded standard base64
std::string encode_base64_payload(const std::vector<uint8_t>& bytes);

}  // namespace enricher
