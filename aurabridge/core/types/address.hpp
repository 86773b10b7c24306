// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>

#include <evmc/evmc.hpp>

#include <aurabridge/core/common/bytes.hpp>
#include <aurabridge/core/common/decoding_result.hpp>
#include <aurabridge/core/rlp/decode.hpp>
#include <aurabridge/core/types/evmc_bytes32.hpp>

namespace aurabridge {

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
// Terminates the program if hex is not a valid hex encoding, unless return_zero_on_err is true.
std::string address_to_hex(const evmc::address& address);

namespace rlp {
    void encode(Bytes& to, const evmc::address& address);
    DecodingResult decode(ByteView& from, evmc::address& address, Leftover mode = Leftover::kProhibit) noexcept;
    size_t length(const evmc::address& address) noexcept;
}  // namespace rlp

}  // namespace aurabridge

namespace evmc {

using aurabridge::rlp::decode;
using aurabridge::rlp::encode;
using aurabridge::rlp::length;

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
