// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <tl/expected.hpp>

namespace aurabridge {

// Error codes for RLP and other decoding
enum class [[nodiscard]] DecodingError {
    kOverflow,
    kLeadingZero,
    kInputTooShort,
    kInputTooLong,
    kNonCanonicalSize,
    kNonCanonicalOrder,  // ordered collections must be strictly ascending
    kUnexpectedLength,
    kUnexpectedString,
    kUnexpectedList,
    kUnexpectedListElements,
    kInvalidFieldset,
};

// TODO(C++23) Switch to std::expected
using DecodingResult = tl::expected<void, DecodingError>;

std::string decoding_error_to_string(DecodingError error);

}  // namespace aurabridge
