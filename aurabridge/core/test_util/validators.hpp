// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <aurabridge/core/common/bytes.hpp>
#include <aurabridge/core/types/empty_step.hpp>

namespace aurabridge::test_util {

//! Secret key of the test validator at the given index: 32 bytes all set to index + 1
Bytes validator_secret(size_t index);

evmc::address validator_address(size_t index);

//! Addresses of the first \p count test validators, in index order
std::vector<evmc::address> validators_addresses(size_t count);

//! Signs a 32 bytes message with the key of the test validator at the given index
Signature sign(size_t index, const evmc::bytes32& message);

//! Empty step for \p step signed by the test validator at the given index over \p parent_hash
SealedEmptyStep sealed_empty_step(size_t index, uint64_t step, const evmc::bytes32& parent_hash);

}  // namespace aurabridge::test_util
