// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"

#include <optional>

#include <evmc/evmc.hpp>

#include <aurabridge/core/common/base.hpp>
#include <aurabridge/core/common/bytes.hpp>

namespace aurabridge::ecdsa {

//! \brief Maps the trailing byte of a 65-byte r || s || v signature to a secp256k1 recovery id.
//! \details Values above 26 are treated as Ethereum style (27/28 based) ids.
//! \return The recovery id in [0, 3], or std::nullopt if out of range
std::optional<uint8_t> recovery_id_from_v(uint8_t v) noexcept;

//! \brief Tries recover public key used for message signing.
//! \param [in] message : the signed 32 bytes message hash
//! \param [in] signature : the 64 bytes compact signature
//! \param [in] recovery_id : the recovery id in [0, 3]
//! \return The 65 bytes uncompressed public key. Should it have no value the recovery has failed
std::optional<Bytes> recover(ByteView message, ByteView signature, uint8_t recovery_id) noexcept;

//! \brief Derives the address owning an uncompressed public key
//! \remarks The first byte of the key (0x04) is ignored; the address is the last 20 bytes of the keccak256 hash
std::optional<evmc::address> public_key_to_address(ByteView public_key) noexcept;

//! \brief Tries recover the address which signed a message with a 65 bytes r || s || v signature
std::optional<evmc::address> recover_address(const evmc::bytes32& message, ByteView signature) noexcept;

}  // namespace aurabridge::ecdsa
