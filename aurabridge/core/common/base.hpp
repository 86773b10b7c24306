// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, concepts, types, and constants.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>

#include <intx/intx.hpp>

#include <aurabridge/core/common/assert.hpp>

#if defined(__wasm__)
#define AURABRIDGE_THREAD_LOCAL static
#else
#define AURABRIDGE_THREAD_LOCAL thread_local
#endif

namespace aurabridge {

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256> || std::same_as<T, intx::uint512>;

using BlockNum = uint64_t;

inline constexpr BlockNum kMaxBlockNum = std::numeric_limits<BlockNum>::max();

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// r || s || v
inline constexpr size_t kSignatureLength{65};

// Logs bloom of an Aura header
inline constexpr size_t kBloomByteLength{256};

}  // namespace aurabridge
