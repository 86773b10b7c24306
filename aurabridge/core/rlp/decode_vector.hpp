// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <aurabridge/core/rlp/decode.hpp>
#include <aurabridge/core/rlp/encode_vector.hpp>

namespace aurabridge::rlp {

template <typename Arg1, typename Arg2>
DecodingResult decode_items(ByteView& from, Arg1& arg1, Arg2& arg2) noexcept {
    if (DecodingResult res{decode(from, arg1, Leftover::kAllow)}; !res) {
        return res;
    }
    return decode(from, arg2, Leftover::kAllow);
}

template <typename Arg1, typename Arg2, typename... Args>
DecodingResult decode_items(ByteView& from, Arg1& arg1, Arg2& arg2, Args&... args) noexcept {
    if (DecodingResult res{decode(from, arg1, Leftover::kAllow)}; !res) {
        return res;
    }
    return decode_items(from, arg2, args...);
}

//! Decodes an RLP list with a fixed number of items with various types
template <typename Arg1, typename Arg2, typename... Args>
DecodingResult decode(ByteView& from, Leftover mode, Arg1& arg1, Arg2& arg2, Args&... args) noexcept {
    const auto header{decode_header(from)};
    if (!header) {
        return tl::unexpected{header.error()};
    }
    if (!header->list) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    const uint64_t leftover{from.size() - header->payload_length};
    if (mode != Leftover::kAllow && leftover) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }

    if (DecodingResult res{decode_items(from, arg1, arg2, args...)}; !res) {
        return res;
    }

    if (from.size() != leftover) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    return {};
}

}  // namespace aurabridge::rlp
