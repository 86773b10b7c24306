// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <catch2/catch.hpp>

#include <aurabridge/core/common/util.hpp>

#include "decode_vector.hpp"

namespace aurabridge::rlp {

template <class T>
static T decode_success(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    T res{};
    REQUIRE(decode(view, res));
    return res;
}

template <class T>
static DecodingError decode_failure(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    T x{};
    DecodingResult res{decode(view, x)};
    REQUIRE(!res);
    return res.error();
}

TEST_CASE("RLP decoding") {
    SECTION("strings") {
        CHECK(to_hex(decode_success<Bytes>("00")) == "00");
        CHECK(to_hex(decode_success<Bytes>("8D6F62636465666768696A6B6C6D")) == "6f62636465666768696a6b6c6d");

        CHECK(decode_failure<Bytes>("8D6F62636465666768696A6B6C6Daa") == DecodingError::kInputTooLong);
        CHECK(decode_failure<Bytes>("C0") == DecodingError::kUnexpectedList);
    }

    SECTION("uint64") {
        CHECK(decode_success<uint64_t>("09") == 9);
        CHECK(decode_success<uint64_t>("80") == 0);
        CHECK(decode_success<uint64_t>("820505") == 0x0505);
        CHECK(decode_success<uint64_t>("85CE05050505") == 0xCE05050505);

        CHECK(decode_failure<uint64_t>("85CE05050505aa") == DecodingError::kInputTooLong);
        CHECK(decode_failure<uint64_t>("C0") == DecodingError::kUnexpectedList);
        CHECK(decode_failure<uint64_t>("00") == DecodingError::kLeadingZero);
        CHECK(decode_failure<uint64_t>("8105") == DecodingError::kNonCanonicalSize);
        CHECK(decode_failure<uint64_t>("8200F4") == DecodingError::kLeadingZero);
        CHECK(decode_failure<uint64_t>("B8020004") == DecodingError::kNonCanonicalSize);
        CHECK(decode_failure<uint64_t>("8AFFFFFFFFFFFFFFFFFF7C") == DecodingError::kOverflow);
    }

    SECTION("uint256") {
        CHECK(decode_success<intx::uint256>("09") == 9);
        CHECK(decode_success<intx::uint256>("8AFFFFFFFFFFFFFFFFFF7C") ==
              intx::from_string<intx::uint256>("0xFFFFFFFFFFFFFFFFFF7C"));
        CHECK(decode_failure<intx::uint256>("8BFFFFFFFFFFFFFFFFFF7C") == DecodingError::kInputTooShort);
    }

    SECTION("list payloads") {
        Bytes bytes{*from_hex("C3010203")};
        ByteView view{bytes};
        const auto payload{decode_list_payload(view)};
        REQUIRE(payload);
        CHECK(to_hex(*payload) == "010203");
        CHECK(view.empty());

        bytes = *from_hex("83010203");
        view = bytes;
        CHECK(decode_list_payload(view).error() == DecodingError::kUnexpectedString);

        bytes = *from_hex("C4010203");
        view = bytes;
        CHECK(decode_list_payload(view).error() == DecodingError::kInputTooShort);
    }

    SECTION("fixed lists") {
        Bytes bytes{*from_hex("C20102")};
        ByteView view{bytes};
        uint64_t a{0}, b{0};
        CHECK(decode(view, Leftover::kProhibit, a, b));
        CHECK(a == 1);
        CHECK(b == 2);

        bytes = *from_hex("C3010203");
        view = bytes;
        CHECK(decode(view, Leftover::kProhibit, a, b).error() == DecodingError::kUnexpectedListElements);
    }

    SECTION("raw items") {
        Bytes bytes{*from_hex("0982050580C101")};
        ByteView view{bytes};
        CHECK(to_hex(*decode_raw_item(view)) == "09");
        CHECK(to_hex(*decode_raw_item(view)) == "820505");
        CHECK(to_hex(*decode_raw_item(view)) == "80");
        CHECK(to_hex(*decode_raw_item(view)) == "c101");
        CHECK(view.empty());
        CHECK(decode_raw_item(view).error() == DecodingError::kInputTooShort);
    }
}

TEST_CASE("RLP encoding") {
    Bytes to;
    encode(to, uint64_t{0});
    encode(to, uint64_t{0x7F});
    encode(to, uint64_t{0x400});
    CHECK(to_hex(to) == "807f820400");

    to.clear();
    encode(to, uint64_t{1}, uint64_t{2}, uint64_t{3});
    CHECK(to_hex(to) == "c3010203");

    to.clear();
    const Bytes long_string(56, 0xAA);
    encode(to, ByteView{long_string});
    CHECK(to.size() == 58);
    CHECK(to[0] == 0xB8);
    CHECK(to[1] == 56);
    CHECK(length(ByteView{long_string}) == 58);
}

}  // namespace aurabridge::rlp
