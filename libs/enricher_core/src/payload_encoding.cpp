// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/payload_encoding.hpp"
#include "enricher/errors.hpp"

#include <absl/strings/escaping.h>
#include <absl/strings/string_view.h>

namespace enricher {

std::vector<uint8_t> decode_base64_payload(const std::string& text) {
    std::string decoded;
    if (!absl::Base64Unescape(text, &decoded)) {
        throw PayloadEncodingError("Record data is not valid base64 (" +
                                   std::to_string(text.size()) + " chars)");
    }
    return std::vector<uint8_t>(decoded.begin(), decoded.end());
}

std::string encode_base64_payload(const std::vector<uint8_t>& bytes) {
    return absl::Base64Escape(absl::string_view(
        reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

}  // namespace enricher
