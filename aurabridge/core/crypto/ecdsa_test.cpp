// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <catch2/catch.hpp>

#include <aurabridge/core/common/util.hpp>
#include <aurabridge/core/crypto/secp256k1_context.hpp>
#include <aurabridge/core/types/address.hpp>

namespace aurabridge::ecdsa {

using namespace evmc::literals;

TEST_CASE("Recovery id from v") {
    CHECK(recovery_id_from_v(0) == 0);
    CHECK(recovery_id_from_v(1) == 1);
    CHECK(recovery_id_from_v(3) == 3);
    CHECK(recovery_id_from_v(4) == std::nullopt);
    CHECK(recovery_id_from_v(26) == std::nullopt);

    CHECK(recovery_id_from_v(27) == 0);
    CHECK(recovery_id_from_v(28) == 1);
    CHECK(recovery_id_from_v(30) == 3);
    CHECK(recovery_id_from_v(31) == std::nullopt);
    CHECK(recovery_id_from_v(255) == std::nullopt);
}

TEST_CASE("Public key to address") {
    SecP256K1Context context{/*allow_verify=*/false, /*allow_sign=*/true};
    const Bytes private_key{*from_hex("0x0000000000000000000000000000000000000000000000000000000000000001")};
    secp256k1_pubkey public_key;
    REQUIRE(context.create_public_key(&public_key, private_key));

    const Bytes serialized{context.serialize_public_key(&public_key)};
    CHECK(public_key_to_address(serialized) == 0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address);

    CHECK(public_key_to_address(ByteView{serialized}.substr(0, 33)) == std::nullopt);
    CHECK(public_key_to_address({}) == std::nullopt);
}

TEST_CASE("Recover address") {
    SecP256K1Context context{/*allow_verify=*/true, /*allow_sign=*/true};
    const Bytes private_key(32, 0x01);
    const auto message{0x9c22ff5f21f0b81b113e63f7db6da94fedef11b2119b4088b89664fb9a3cb658_bytes32};

    secp256k1_pubkey public_key;
    REQUIRE(context.create_public_key(&public_key, private_key));
    const auto expected{public_key_to_address(context.serialize_public_key(&public_key))};
    REQUIRE(expected);

    secp256k1_ecdsa_recoverable_signature recoverable;
    REQUIRE(context.sign_recoverable(&recoverable, ByteView{message.bytes}, private_key));
    const auto [compact, recovery_id]{context.serialize_recoverable_signature(&recoverable)};

    Bytes signature{compact};
    signature.push_back(recovery_id);

    SECTION("raw recovery id") {
        CHECK(recover_address(message, signature) == expected);
    }

    SECTION("Ethereum style v") {
        signature.back() = static_cast<uint8_t>(recovery_id + 27);
        CHECK(recover_address(message, signature) == expected);
    }

    SECTION("wrong message") {
        const auto other_message{0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        CHECK(recover_address(other_message, signature) != expected);
    }

    SECTION("out of range v") {
        signature.back() = 4;
        CHECK(recover_address(message, signature) == std::nullopt);
    }

    SECTION("wrong length") {
        signature.pop_back();
        CHECK(recover_address(message, signature) == std::nullopt);
    }

    SECTION("zeroed signature") {
        const Bytes zeroed(kSignatureLength, 0);
        CHECK(recover_address(message, zeroed) == std::nullopt);
    }
}

}  // namespace aurabridge::ecdsa
