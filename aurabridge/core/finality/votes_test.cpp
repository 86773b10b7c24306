// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "votes.hpp"

#include <catch2/catch.hpp>

#include <aurabridge/core/common/util.hpp>

namespace aurabridge {

using namespace evmc::literals;

static const auto kValidator1{0x1000000000000000000000000000000000000001_address};
static const auto kValidator2{0x2000000000000000000000000000000000000002_address};
static const auto kValidator3{0x3000000000000000000000000000000000000003_address};
static const auto kRelayer{0xbeef00000000000000000000000000000000beef_address};

static const auto kHash1{0x1111111111111111111111111111111111111111111111111111111111111111_bytes32};
static const auto kHash2{0x2222222222222222222222222222222222222222222222222222222222222222_bytes32};
static const auto kHash3{0x3333333333333333333333333333333333333333333333333333333333333333_bytes32};

template <class T>
static Bytes encoded(const T& value) {
    Bytes out;
    rlp::encode(out, value);
    return out;
}

//! RLP list made of already encoded items
static Bytes list_of(std::initializer_list<Bytes> items) {
    Bytes payload;
    for (const auto& item : items) {
        payload.append(item);
    }
    Bytes out;
    rlp::encode_header(out, {.list = true, .payload_length = payload.length()});
    out.append(payload);
    return out;
}

static FinalityVotes<evmc::address> sample_votes() {
    FinalityVotes<evmc::address> votes;
    votes.ancestry.push_back({.id = {10, kHash1}, .submitter = kRelayer, .signers = {kValidator1, kValidator3}});
    votes.ancestry.push_back({.id = {11, kHash2}, .submitter = std::nullopt, .signers = {kValidator2}});
    votes.ancestry.push_back({.id = {12, kHash3}, .submitter = kRelayer, .signers = {kValidator1}});
    votes.votes = count_votes(votes.ancestry);
    return votes;
}

TEST_CASE("Count votes") {
    const auto votes{sample_votes()};
    CHECK(votes.votes == VoteCounts{{kValidator1, 2}, {kValidator2, 1}, {kValidator3, 1}});
    CHECK(count_votes(std::deque<FinalityAncestor<evmc::address>>{}).empty());
}

TEST_CASE("FinalityAncestor RLP") {
    const FinalityAncestor<evmc::address> ancestor{
        .id = {10, kHash1},
        .submitter = kRelayer,
        .signers = {kValidator1, kValidator3},
    };
    const Bytes bytes{encoded(ancestor)};
    CHECK(bytes.length() == rlp::length(ancestor));
    CHECK(bytes == list_of({encoded(uint64_t{10}), encoded(kHash1),
                            list_of({encoded(kRelayer)}),
                            list_of({encoded(kValidator1), encoded(kValidator3)})}));

    SECTION("decode") {
        FinalityAncestor<evmc::address> decoded;
        ByteView view{bytes};
        REQUIRE(rlp::decode(view, decoded));
        CHECK(decoded == ancestor);
    }

    SECTION("no submitter") {
        const FinalityAncestor<evmc::address> anonymous{.id = {10, kHash1}, .signers = {kValidator2}};
        const Bytes anonymous_bytes{encoded(anonymous)};
        CHECK(anonymous_bytes == list_of({encoded(uint64_t{10}), encoded(kHash1), list_of({}),
                                          list_of({encoded(kValidator2)})}));
        FinalityAncestor<evmc::address> decoded;
        ByteView view{anonymous_bytes};
        REQUIRE(rlp::decode(view, decoded));
        CHECK(decoded == anonymous);
    }

    SECTION("integral submitter") {
        const FinalityAncestor<uint64_t> ancestor_u64{.id = {3, kHash3}, .submitter = 7, .signers = {}};
        const Bytes bytes_u64{encoded(ancestor_u64)};
        CHECK(bytes_u64.length() == rlp::length(ancestor_u64));
        FinalityAncestor<uint64_t> decoded;
        ByteView view{bytes_u64};
        REQUIRE(rlp::decode(view, decoded));
        CHECK(decoded == ancestor_u64);
    }

    SECTION("unsorted signers") {
        const Bytes unsorted{list_of({encoded(uint64_t{10}), encoded(kHash1), list_of({}),
                                      list_of({encoded(kValidator3), encoded(kValidator1)})})};
        FinalityAncestor<evmc::address> decoded;
        ByteView view{unsorted};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kNonCanonicalOrder});
    }

    SECTION("duplicate signers") {
        const Bytes duplicated{list_of({encoded(uint64_t{10}), encoded(kHash1), list_of({}),
                                        list_of({encoded(kValidator1), encoded(kValidator1)})})};
        FinalityAncestor<evmc::address> decoded;
        ByteView view{duplicated};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kNonCanonicalOrder});
    }

    SECTION("two submitters") {
        const Bytes two_submitters{list_of({encoded(uint64_t{10}), encoded(kHash1),
                                            list_of({encoded(kRelayer), encoded(kRelayer)}), list_of({})})};
        FinalityAncestor<evmc::address> decoded;
        ByteView view{two_submitters};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kUnexpectedListElements});
    }

    SECTION("extra field") {
        const Bytes extra{list_of({encoded(uint64_t{10}), encoded(kHash1), list_of({}), list_of({}),
                                   encoded(uint64_t{1})})};
        FinalityAncestor<evmc::address> decoded;
        ByteView view{extra};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kUnexpectedListElements});
    }

    SECTION("missing field") {
        const Bytes missing{list_of({encoded(uint64_t{10}), encoded(kHash1), list_of({})})};
        FinalityAncestor<evmc::address> decoded;
        ByteView view{missing};
        CHECK(!rlp::decode(view, decoded));
    }
}

TEST_CASE("FinalityVotes RLP") {
    const auto votes{sample_votes()};
    const Bytes bytes{encoded(votes)};
    CHECK(bytes.length() == rlp::length(votes));

    const auto vote_entry = [](const evmc::address& address, uint64_t count) {
        return list_of({encoded(address), encoded(count)});
    };
    const Bytes canonical_votes{list_of({vote_entry(kValidator1, 2), vote_entry(kValidator2, 1),
                                         vote_entry(kValidator3, 1)})};
    const Bytes ancestry{list_of({encoded(votes.ancestry[0]), encoded(votes.ancestry[1]),
                                  encoded(votes.ancestry[2])})};
    CHECK(bytes == list_of({canonical_votes, ancestry}));

    SECTION("decode") {
        FinalityVotes<evmc::address> decoded;
        ByteView view{bytes};
        REQUIRE(rlp::decode(view, decoded));
        CHECK(decoded == votes);
    }

    SECTION("empty") {
        const FinalityVotes<evmc::address> empty;
        const Bytes empty_bytes{encoded(empty)};
        CHECK(empty_bytes == *from_hex("0xc2c0c0"));
        FinalityVotes<evmc::address> decoded{sample_votes()};
        ByteView view{empty_bytes};
        REQUIRE(rlp::decode(view, decoded));
        CHECK(decoded == empty);
    }

    SECTION("trailing bytes") {
        Bytes extended{bytes};
        extended.push_back(0x80);
        FinalityVotes<evmc::address> decoded;
        ByteView view{extended};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kInputTooLong});
    }

    SECTION("unsorted votes") {
        const Bytes unsorted{list_of({vote_entry(kValidator2, 1), vote_entry(kValidator1, 2),
                                      vote_entry(kValidator3, 1)})};
        FinalityVotes<evmc::address> decoded;
        const Bytes input{list_of({unsorted, ancestry})};
        ByteView view{input};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kNonCanonicalOrder});
    }

    SECTION("zero count") {
        const Bytes zero{list_of({vote_entry(kValidator1, 2), vote_entry(kValidator2, 1),
                                  vote_entry(kValidator3, 1), vote_entry(kRelayer, 0)})};
        FinalityVotes<evmc::address> decoded;
        const Bytes input{list_of({zero, ancestry})};
        ByteView view{input};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kInvalidFieldset});
    }

    SECTION("votes disagreeing with ancestry") {
        const Bytes wrong{list_of({vote_entry(kValidator1, 1), vote_entry(kValidator2, 1),
                                   vote_entry(kValidator3, 1)})};
        FinalityVotes<evmc::address> decoded;
        const Bytes input{list_of({wrong, ancestry})};
        ByteView view{input};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kInvalidFieldset});
    }

    SECTION("non contiguous ancestry") {
        const Bytes gap{list_of({encoded(votes.ancestry[0]), encoded(votes.ancestry[2])})};
        const Bytes gap_votes{list_of({vote_entry(kValidator1, 2), vote_entry(kValidator3, 1)})};
        FinalityVotes<evmc::address> decoded;
        const Bytes input{list_of({gap_votes, gap})};
        ByteView view{input};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kInvalidFieldset});
    }

    SECTION("not a list") {
        FinalityVotes<evmc::address> decoded;
        const Bytes input{encoded(kHash1)};
        ByteView view{input};
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kUnexpectedString});
    }

    SECTION("truncated") {
        FinalityVotes<evmc::address> decoded;
        ByteView view{bytes};
        view.remove_suffix(1);
        CHECK(rlp::decode(view, decoded) == tl::unexpected{DecodingError::kInputTooShort});
    }
}

}  // namespace aurabridge
