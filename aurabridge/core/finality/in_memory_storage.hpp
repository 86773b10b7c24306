// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <utility>

#include <evmc/evmc.hpp>

#include <aurabridge/core/chain/config.hpp>
#include <aurabridge/core/common/bytes.hpp>
#include <aurabridge/core/common/decoding_result.hpp>
#include <aurabridge/core/finality/storage.hpp>
#include <aurabridge/core/finality/votes.hpp>
#include <aurabridge/core/types/evmc_bytes32.hpp>
#include <aurabridge/core/types/header.hpp>
#include <aurabridge/infra/common/log.hpp>

namespace aurabridge {

//! \brief FinalityStorage keeping headers and encoded finality votes in memory
//! \remarks Not thread safe: imports must be serialized by the caller
template <class Submitter>
class InMemoryFinalityStorage : public FinalityStorage<Submitter> {
  public:
    using StopPredicate = typename FinalityStorage<Submitter>::StopPredicate;

    explicit InMemoryFinalityStorage(const AuraConfig& config = {})
        : caching_interval_{config.finality_votes_caching_interval} {}

    //! \brief Stores an imported header along with the votes computed when importing it
    //! \details Votes are cached only for headers whose number is a multiple of the caching interval
    void insert_header(const Header& header, std::optional<Submitter> submitter, const FinalityVotes<Submitter>& votes) {
        const evmc::bytes32 hash{header.hash()};
        if (caching_interval_ && header.number != 0 && header.number % *caching_interval_ == 0) {
            cache_finality_votes(hash, votes);
        }
        headers_.insert_or_assign(hash, StoredHeader{header, std::move(submitter)});
    }

    void cache_finality_votes(const evmc::bytes32& hash, const FinalityVotes<Submitter>& votes) {
        Bytes encoded;
        rlp::encode(encoded, votes);
        finality_cache_.insert_or_assign(hash, std::move(encoded));
    }

    //! \brief Replaces the encoded votes cached for \p hash
    void cache_encoded_finality_votes(const evmc::bytes32& hash, Bytes encoded) {
        finality_cache_.insert_or_assign(hash, std::move(encoded));
    }

    //! \return The votes cached for \p hash or std::nullopt if none or not decodable
    [[nodiscard]] std::optional<FinalityVotes<Submitter>> finality_votes(const evmc::bytes32& hash) const {
        const auto it{finality_cache_.find(hash)};
        if (it == finality_cache_.end()) {
            return std::nullopt;
        }
        FinalityVotes<Submitter> votes;
        ByteView encoded{it->second};
        if (const DecodingResult res{rlp::decode(encoded, votes)}; !res) {
            AURA_ERROR_M("Cannot decode cached finality votes",
                         {"hash", to_hex(hash, /*with_prefix=*/true),
                          "error", decoding_error_to_string(res.error())});
            return std::nullopt;
        }
        return votes;
    }

    [[nodiscard]] std::optional<Header> header(const evmc::bytes32& hash) const {
        const auto it{headers_.find(hash)};
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return it->second.header;
    }

    [[nodiscard]] size_t cached_votes_count() const { return finality_cache_.size(); }

    [[nodiscard]] CachedFinalityVotes<Submitter> cached_finality_votes(const evmc::bytes32& parent_hash,
                                                                       const StopPredicate& stop_at) const override {
        CachedFinalityVotes<Submitter> cached_votes;
        evmc::bytes32 hash{parent_hash};
        while (!stop_at(hash)) {
            if (auto votes{finality_votes(hash)}; votes) {
                cached_votes.votes = std::move(votes);
                break;
            }
            const auto it{headers_.find(hash)};
            if (it == headers_.end() || it->second.header.number == 0) {
                break;
            }
            const StoredHeader& stored{it->second};
            cached_votes.unaccounted_ancestry.push_back(UnaccountedAncestor<Submitter>{
                .id = {stored.header.number, hash},
                .submitter = stored.submitter,
                .header = stored.header,
            });
            hash = stored.header.parent_hash;
        }
        return cached_votes;
    }

  private:
    struct StoredHeader {
        Header header;
        std::optional<Submitter> submitter;
    };

    std::optional<uint64_t> caching_interval_;
    std::map<evmc::bytes32, StoredHeader> headers_;
    std::map<evmc::bytes32, Bytes> finality_cache_;
};

}  // namespace aurabridge
