// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>

#include <evmc/evmc.hpp>

#include <aurabridge/core/common/bytes.hpp>
#include <aurabridge/core/rlp/decode.hpp>

namespace aurabridge {

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

}  // namespace aurabridge

namespace aurabridge::rlp {

void encode(Bytes& to, const evmc::bytes32& value);
size_t length(const evmc::bytes32& value) noexcept;

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace aurabridge::rlp

namespace evmc {
using aurabridge::rlp::decode;
using aurabridge::rlp::encode;
using aurabridge::rlp::length;

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value);
}  // namespace evmc
