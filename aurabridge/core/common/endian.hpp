// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Facilities to deal with byte order/endianness
See https://en.wikipedia.org/wiki/Endianness
*/

#include <cstdint>
#include <cstring>

#include <intx/intx.hpp>

#include <aurabridge/core/common/base.hpp>
#include <aurabridge/core/common/bytes.hpp>
#include <aurabridge/core/common/decoding_result.hpp>
#include <aurabridge/core/common/util.hpp>

namespace aurabridge::endian {

//! \brief Big endian form of an unsigned integer with its leftmost zero bytes stripped
//! \return A ByteView into a thread local buffer owned by the instantiation for T
//! \remarks Each call with the same T overwrites the buffer, invalidating a previously returned view
template <UnsignedIntegral T>
ByteView to_big_compact(const T& value) {
    AURABRIDGE_THREAD_LOCAL uint8_t full_be[sizeof(T)];
    intx::be::unsafe::store(full_be, value);
    return zeroless_view(full_be);
}

//! \brief Parses unsigned integer from a compacted big endian byte form.
//! \param [in] data : byte view of a compacted value.
//! Its length must not be greater than the sizeof the UnsignedIntegral type; otherwise, kOverflow is returned.
//! \param [out] out: the corresponding integer with native endianness.
//! \return Success or kOverflow or kLeadingZero.
template <UnsignedIntegral T>
static DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }

    out = 0;
    if (data.empty()) {
        return {};
    }

    if (data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }

    auto* ptr{reinterpret_cast<uint8_t*>(&out)};
    std::memcpy(ptr + (sizeof(T) - data.size()), &data[0], data.size());

    out = intx::to_big_endian(out);
    return {};
}

}  // namespace aurabridge::endian
