// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <evmc/evmc.hpp>

#include <aurabridge/core/common/base.hpp>
#include <aurabridge/core/types/evmc_bytes32.hpp>

namespace aurabridge {

//! \brief Immutable identity of a block
struct HeaderId {
    BlockNum number{0};
    evmc::bytes32 hash{};

    friend bool operator==(const HeaderId&, const HeaderId&) = default;
};

inline std::ostream& operator<<(std::ostream& out, const HeaderId& id) {
    return out << "#" << id.number << " (" << to_hex(id.hash, /*with_prefix=*/true) << ")";
}

}  // namespace aurabridge
