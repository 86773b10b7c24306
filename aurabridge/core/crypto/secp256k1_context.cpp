// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_context.hpp"

namespace aurabridge {

const size_t SecP256K1Context::kPublicKeySizeUncompressed = 65;

Bytes SecP256K1Context::serialize_public_key(const secp256k1_pubkey* public_key) const {
    size_t data_size{kPublicKeySizeUncompressed};
    Bytes data(data_size, 0);
    secp256k1_ec_pubkey_serialize(context_, data.data(), &data_size, public_key, SECP256K1_EC_UNCOMPRESSED);
    data.resize(data_size);
    return data;
}

unsigned int SecP256K1Context::flags(bool allow_verify, bool allow_sign) {
    unsigned int value = SECP256K1_CONTEXT_NONE;
    if (allow_verify) {
        value |= SECP256K1_CONTEXT_VERIFY;
    }
    if (allow_sign) {
        value |= SECP256K1_CONTEXT_SIGN;
    }
    return value;
}

}  // namespace aurabridge
