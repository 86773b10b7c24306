// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <aurabridge/core/rlp/encode.hpp>

namespace aurabridge::rlp {

template <typename Arg1, typename Arg2>
size_t length_items(const Arg1& arg1, const Arg2& arg2) {
    return length(arg1) + length(arg2);
}

template <typename Arg1, typename Arg2, typename... Args>
size_t length_items(const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    return length(arg1) + length_items(arg2, args...);
}

template <typename Arg1, typename Arg2, typename... Args>
size_t length(const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    const size_t payload_length = length_items(arg1, arg2, args...);
    return length_of_length(payload_length) + payload_length;
}

template <typename Arg1, typename Arg2>
void encode_items(Bytes& to, const Arg1& arg1, const Arg2& arg2) {
    encode(to, arg1);
    encode(to, arg2);
}

template <typename Arg1, typename Arg2, typename... Args>
void encode_items(Bytes& to, const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    encode(to, arg1);
    encode_items(to, arg2, args...);
}

template <typename Arg1, typename Arg2, typename... Args>
void encode(Bytes& to, const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    const Header h{/*list=*/true, /*payload_length=*/length_items(arg1, arg2, args...)};
    to.reserve(to.size() + length_of_length(h.payload_length) + h.payload_length);
    encode_header(to, h);
    encode_items(to, arg1, arg2, args...);
}

}  // namespace aurabridge::rlp
