// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "validators.hpp"

#include <algorithm>
#include <stdexcept>

#include <aurabridge/core/crypto/ecdsa.hpp>
#include <aurabridge/core/crypto/secp256k1_context.hpp>

namespace aurabridge::test_util {

Bytes validator_secret(size_t index) {
    return Bytes(32, static_cast<uint8_t>(index + 1));
}

evmc::address validator_address(size_t index) {
    SecP256K1Context context{/*allow_verify=*/false, /*allow_sign=*/true};
    const Bytes secret{validator_secret(index)};
    secp256k1_pubkey public_key;
    if (!context.create_public_key(&public_key, secret)) {
        throw std::runtime_error("invalid validator secret");
    }
    const auto address{ecdsa::public_key_to_address(context.serialize_public_key(&public_key))};
    if (!address) {
        throw std::runtime_error("invalid validator public key");
    }
    return *address;
}

std::vector<evmc::address> validators_addresses(size_t count) {
    std::vector<evmc::address> addresses;
    addresses.reserve(count);
    for (size_t i{0}; i < count; ++i) {
        addresses.push_back(validator_address(i));
    }
    return addresses;
}

Signature sign(size_t index, const evmc::bytes32& message) {
    SecP256K1Context context{/*allow_verify=*/false, /*allow_sign=*/true};
    secp256k1_ecdsa_recoverable_signature recoverable;
    if (!context.sign_recoverable(&recoverable, ByteView{message.bytes}, validator_secret(index))) {
        throw std::runtime_error("signing failed");
    }
    const auto [compact, recovery_id]{context.serialize_recoverable_signature(&recoverable)};

    Signature signature{};
    std::copy(compact.begin(), compact.end(), signature.begin());
    signature[kSignatureLength - 1] = recovery_id;
    return signature;
}

SealedEmptyStep sealed_empty_step(size_t index, uint64_t step, const evmc::bytes32& parent_hash) {
    SealedEmptyStep empty_step{.step = step};
    empty_step.signature = sign(index, empty_step.message(parent_hash));
    return empty_step;
}

}  // namespace aurabridge::test_util
