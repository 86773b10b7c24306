// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <aurabridge/core/common/util.hpp>
#include <aurabridge/core/rlp/encode.hpp>

namespace aurabridge {

namespace rlp {

    void encode(Bytes& to, const evmc::address& address) {
        encode(to, ByteView{address.bytes});
    }

    DecodingResult decode(ByteView& from, evmc::address& address, Leftover mode) noexcept {
        return decode(from, address.bytes, mode);
    }

    size_t length(const evmc::address& address) noexcept {
        return length(ByteView{address.bytes});
    }

}  // namespace rlp

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

}  // namespace aurabridge

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << aurabridge::address_to_hex(address);
}

}  // namespace evmc
