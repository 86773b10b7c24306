// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decoding_result.hpp"

namespace aurabridge {

std::string decoding_error_to_string(DecodingError error) {
    switch (error) {
        case DecodingError::kOverflow:
            return "rlp: uint overflow";
        case DecodingError::kLeadingZero:
            return "rlp: leading zero";
        case DecodingError::kInputTooShort:
            return "rlp: value size exceeds available input length";
        case DecodingError::kInputTooLong:
            return "rlp: input exceeds encoded length";
        case DecodingError::kNonCanonicalSize:
            return "rlp: non-canonical size information";
        case DecodingError::kNonCanonicalOrder:
            return "rlp: non-canonical order of elements";
        case DecodingError::kUnexpectedLength:
            return "rlp: unexpected length";
        case DecodingError::kUnexpectedString:
            return "rlp: expected list, got string instead";
        case DecodingError::kUnexpectedList:
            return "rlp: expected string, got list instead";
        case DecodingError::kUnexpectedListElements:
            return "rlp: unexpected list element(s)";
        case DecodingError::kInvalidFieldset:
            return "rlp: invalid field set";
    }
    return "rlp: unknown error [" + std::to_string(static_cast<int>(error)) + "]";
}

}  // namespace aurabridge
