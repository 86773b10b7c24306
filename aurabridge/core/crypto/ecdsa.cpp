// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <cstring>

#include <aurabridge/core/common/util.hpp>
#include <aurabridge/core/crypto/secp256k1_context.hpp>

namespace aurabridge::ecdsa {

std::optional<uint8_t> recovery_id_from_v(uint8_t v) noexcept {
    const uint8_t recovery_id = v > 26 ? static_cast<uint8_t>(v - 27) : v;
    if (recovery_id > 3) {
        return std::nullopt;
    }
    return recovery_id;
}

std::optional<Bytes> recover(ByteView message, ByteView signature, uint8_t recovery_id) noexcept {
    AURABRIDGE_THREAD_LOCAL SecP256K1Context context;

    if (message.size() != 32 || signature.size() != 64) {
        return std::nullopt;
    }

    secp256k1_ecdsa_recoverable_signature sig;
    if (!context.parse_recoverable_signature(&sig, signature, recovery_id)) {
        return std::nullopt;
    }

    secp256k1_pubkey pub_key;
    if (!context.recover_signature_public_key(&pub_key, &sig, message)) {
        return std::nullopt;
    }

    return context.serialize_public_key(&pub_key);
}

std::optional<evmc::address> public_key_to_address(ByteView public_key) noexcept {
    if (public_key.size() != SecP256K1Context::kPublicKeySizeUncompressed || public_key[0] != 4u) {
        return std::nullopt;
    }
    // Ignore first byte of public key
    const auto key_hash{keccak256(public_key.substr(1))};
    evmc::address out;
    std::memcpy(out.bytes, &key_hash.bytes[12], kAddressLength);
    return out;
}

std::optional<evmc::address> recover_address(const evmc::bytes32& message, ByteView signature) noexcept {
    if (signature.size() != kSignatureLength) {
        return std::nullopt;
    }
    const auto recovery_id{recovery_id_from_v(signature[kSignatureLength - 1])};
    if (!recovery_id) {
        return std::nullopt;
    }
    const auto public_key{recover(ByteView{message.bytes}, signature.substr(0, kSignatureLength - 1), *recovery_id)};
    if (!public_key) {
        return std::nullopt;
    }
    return public_key_to_address(*public_key);
}

}  // namespace aurabridge::ecdsa
