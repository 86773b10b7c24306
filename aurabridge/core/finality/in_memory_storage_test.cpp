// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_storage.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <aurabridge/core/common/util.hpp>
#include <aurabridge/core/test_util/header_chain.hpp>
#include <aurabridge/core/test_util/validators.hpp>
#include <aurabridge/infra/test_util/log.hpp>

namespace aurabridge {

using namespace evmc::literals;

using Submitter = evmc::address;

static FinalityVotes<Submitter> single_vote(const Header& header) {
    return {
        .votes = {{header.author, 1}},
        .ancestry = {FinalityAncestor<Submitter>{.id = header.id(), .submitter = std::nullopt, .signers = {header.author}}},
    };
}

static std::vector<BlockNum> unaccounted_numbers(const CachedFinalityVotes<Submitter>& cached) {
    std::vector<BlockNum> numbers;
    for (const auto& ancestor : cached.unaccounted_ancestry) {
        numbers.push_back(ancestor.id.number);
    }
    return numbers;
}

TEST_CASE("In-memory storage caches votes at the caching interval") {
    const std::vector<size_t> authors{0, 1, 2};
    const auto chain{test_util::build_chain(7, authors)};

    SECTION("no caching interval") {
        InMemoryFinalityStorage<Submitter> storage;
        for (const auto& header : chain) {
            storage.insert_header(header, std::nullopt, single_vote(header));
        }
        CHECK(storage.cached_votes_count() == 0);
        CHECK(storage.header(chain[4].hash()) == chain[4]);
        CHECK(storage.header(evmc::bytes32{}) == std::nullopt);
    }

    SECTION("interval 3") {
        InMemoryFinalityStorage<Submitter> storage{AuraConfig{.finality_votes_caching_interval = 3}};
        for (const auto& header : chain) {
            storage.insert_header(header, std::nullopt, single_vote(header));
        }
        CHECK(storage.cached_votes_count() == 2);
        CHECK(storage.finality_votes(chain[3].hash()) == single_vote(chain[3]));
        CHECK(storage.finality_votes(chain[6].hash()) == single_vote(chain[6]));
        CHECK(storage.finality_votes(chain[0].hash()) == std::nullopt);
        CHECK(storage.finality_votes(chain[4].hash()) == std::nullopt);
    }
}

TEST_CASE("In-memory storage walks the ancestry") {
    const std::vector<size_t> authors{0, 1, 2};
    const auto chain{test_util::build_chain(6, authors)};
    const auto never = [](const evmc::bytes32&) { return false; };

    InMemoryFinalityStorage<Submitter> storage;
    for (const auto& header : chain) {
        storage.insert_header(header, header.number == 2 ? std::optional<Submitter>{header.author} : std::nullopt, {});
    }

    SECTION("up to genesis") {
        const auto cached{storage.cached_finality_votes(chain[5].hash(), never)};
        CHECK(!cached.votes);
        CHECK(unaccounted_numbers(cached) == std::vector<BlockNum>{5, 4, 3, 2, 1});
        CHECK(cached.unaccounted_ancestry[0].id == chain[5].id());
        CHECK(cached.unaccounted_ancestry[0].header == chain[5]);
        CHECK(cached.unaccounted_ancestry[3].submitter == chain[2].author);
        CHECK(cached.unaccounted_ancestry[4].submitter == std::nullopt);
    }

    SECTION("genesis parent") {
        const auto cached{storage.cached_finality_votes(chain[0].hash(), never)};
        CHECK(!cached.votes);
        CHECK(cached.unaccounted_ancestry.empty());
    }

    SECTION("stop predicate") {
        const auto at_2 = [&](const evmc::bytes32& hash) { return hash == chain[2].hash(); };
        auto cached{storage.cached_finality_votes(chain[5].hash(), at_2)};
        CHECK(!cached.votes);
        CHECK(unaccounted_numbers(cached) == std::vector<BlockNum>{5, 4, 3});

        cached = storage.cached_finality_votes(chain[2].hash(), at_2);
        CHECK(cached.unaccounted_ancestry.empty());
    }

    SECTION("cached votes") {
        storage.cache_finality_votes(chain[3].hash(), single_vote(chain[3]));
        const auto cached{storage.cached_finality_votes(chain[5].hash(), never)};
        CHECK(cached.votes == single_vote(chain[3]));
        CHECK(unaccounted_numbers(cached) == std::vector<BlockNum>{5, 4});
    }

    SECTION("stop predicate checked before the cache") {
        storage.cache_finality_votes(chain[3].hash(), single_vote(chain[3]));
        const auto at_3 = [&](const evmc::bytes32& hash) { return hash == chain[3].hash(); };
        const auto cached{storage.cached_finality_votes(chain[5].hash(), at_3)};
        CHECK(!cached.votes);
        CHECK(unaccounted_numbers(cached) == std::vector<BlockNum>{5, 4});
    }

    SECTION("unknown header") {
        const auto cached{storage.cached_finality_votes(0x01_bytes32, never)};
        CHECK(!cached.votes);
        CHECK(cached.unaccounted_ancestry.empty());
    }

    SECTION("pruned ancestry") {
        InMemoryFinalityStorage<Submitter> pruned;
        for (size_t i{3}; i < chain.size(); ++i) {
            pruned.insert_header(chain[i], std::nullopt, {});
        }
        const auto cached{pruned.cached_finality_votes(chain[5].hash(), never)};
        CHECK(unaccounted_numbers(cached) == std::vector<BlockNum>{5, 4, 3});
    }
}

TEST_CASE("In-memory storage treats undecodable votes as a cache miss") {
    const std::vector<size_t> authors{0, 1};
    const auto chain{test_util::build_chain(3, authors)};
    InMemoryFinalityStorage<Submitter> storage;
    for (const auto& header : chain) {
        storage.insert_header(header, std::nullopt, {});
    }
    storage.cache_encoded_finality_votes(chain[2].hash(), *from_hex("c1c0"));

    test_util::SetLogVerbosityGuard guard{log::Level::kError};
    std::stringstream errors;
    test_util::StreamSwap cerr_swap{std::cerr, errors};

    CHECK(storage.finality_votes(chain[2].hash()) == std::nullopt);
    const auto cached{storage.cached_finality_votes(chain[3].hash(), [](const evmc::bytes32&) { return false; })};
    CHECK(!cached.votes);
    CHECK(unaccounted_numbers(cached) == std::vector<BlockNum>{3, 2, 1});
    CHECK(errors.str().find("Cannot decode cached finality votes") != std::string::npos);
}

}  // namespace aurabridge
