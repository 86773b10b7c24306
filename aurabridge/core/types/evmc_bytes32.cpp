// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <aurabridge/core/common/util.hpp>
#include <aurabridge/core/rlp/encode.hpp>

namespace aurabridge {

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return aurabridge::to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace aurabridge

namespace aurabridge::rlp {

void encode(Bytes& to, const evmc::bytes32& value) {
    aurabridge::rlp::encode(to, ByteView{value.bytes});
}

size_t length(const evmc::bytes32& value) noexcept {
    return aurabridge::rlp::length(ByteView{value.bytes});
}

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode) noexcept {
    return aurabridge::rlp::decode(from, to.bytes, mode);
}

}  // namespace aurabridge::rlp

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value) {
    return out << aurabridge::to_hex(value, /*with_prefix=*/true);
}

}  // namespace evmc
