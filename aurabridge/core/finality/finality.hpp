// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <deque>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <aurabridge/core/common/base.hpp>
#include <aurabridge/core/finality/empty_steps.hpp>
#include <aurabridge/core/finality/error.hpp>
#include <aurabridge/core/finality/storage.hpp>
#include <aurabridge/core/finality/vote_counter.hpp>
#include <aurabridge/core/finality/votes.hpp>
#include <aurabridge/core/types/address.hpp>
#include <aurabridge/core/types/header.hpp>
#include <aurabridge/infra/common/log.hpp>

namespace aurabridge {

//! \brief Whether the outstanding votes are enough to finalize a header
//! \param requires_two_thirds_majority : apply the > 2/3 rule instead of the > 1/2 one
bool is_finalized(const ValidatorSet& validators, const VoteCounts& votes, bool requires_two_thirds_majority);

//! \brief Brings cached votes up to date with the ancestry of \p header and adds the header itself
//! \details Ancestors at or below best_finalized_number are dropped from the cached votes. Every unaccounted
//! ancestor is then credited with its author and with the empty step signers sealed into its child.
//! A single validator set is assumed to be in effect over the whole ancestry.
//! \return FinalityError::kNotValidator if the header author or any credited signer is not a validator
template <class Submitter>
tl::expected<FinalityVotes<Submitter>, FinalityError> prepare_votes(CachedFinalityVotes<Submitter> cached_votes,
                                                                    BlockNum best_finalized_number,
                                                                    const ValidatorSet& validators,
                                                                    const HeaderId& id,
                                                                    const Header& header,
                                                                    std::optional<Submitter> submitter) {
    if (!validators.contains(header.author)) {
        AURA_DEBUG_M("Header author is not a validator",
                     {"number", std::to_string(id.number), "author", address_to_hex(header.author)});
        return tl::unexpected{FinalityError::kNotValidator};
    }

    FinalityVotes<Submitter> votes{cached_votes.votes ? std::move(*cached_votes.votes) : FinalityVotes<Submitter>{}};

    while (!votes.ancestry.empty() && votes.ancestry.front().id.number <= best_finalized_number) {
        remove_signers_votes(votes.ancestry.front().signers, votes.votes);
        votes.ancestry.pop_front();
    }

    // Empty steps sealed into a header attest missed slots on top of its parent
    SignerSet child_empty_steps_signers{empty_steps_signers(header)};
    std::deque<FinalityAncestor<Submitter>> new_ancestry;
    for (auto& ancestor : cached_votes.unaccounted_ancestry) {
        SignerSet signers{std::exchange(child_empty_steps_signers, empty_steps_signers(ancestor.header))};
        signers.insert(ancestor.header.author);

        if (const auto added{add_signers_votes(validators, signers, votes.votes)}; !added) {
            return tl::unexpected{added.error()};
        }

        new_ancestry.push_front(FinalityAncestor<Submitter>{
            .id = ancestor.id,
            .submitter = std::move(ancestor.submitter),
            .signers = std::move(signers),
        });
    }
    std::move(new_ancestry.begin(), new_ancestry.end(), std::back_inserter(votes.ancestry));

    ++votes.votes[header.author];
    votes.ancestry.push_back(FinalityAncestor<Submitter>{
        .id = id,
        .submitter = std::move(submitter),
        .signers = {header.author},
    });

    return votes;
}

//! \brief Finds the ancestors of \p header finalized once it gets imported
//! \param validators_anchor : header the validator set has been enacted at
//! \param two_thirds_majority_transition : number of the first header finalized by the > 2/3 rule
//! \return The finalized headers in ascending order and the votes to be cached for \p header
template <class Submitter>
tl::expected<FinalityEffects<Submitter>, FinalityError> finalize_blocks(const FinalityStorage<Submitter>& storage,
                                                                        const HeaderId& best_finalized,
                                                                        const HeaderId& validators_anchor,
                                                                        std::span<const evmc::address> validators,
                                                                        const HeaderId& id,
                                                                        const std::optional<Submitter>& submitter,
                                                                        const Header& header,
                                                                        BlockNum two_thirds_majority_transition) {
    const ValidatorSet validator_set(validators.begin(), validators.end());
    auto cached_votes{storage.cached_finality_votes(header.parent_hash, [&](const evmc::bytes32& hash) {
        return hash == validators_anchor.hash || hash == best_finalized.hash;
    })};

    auto votes{prepare_votes(std::move(cached_votes), best_finalized.number, validator_set, id, header, submitter)};
    if (!votes) {
        return tl::unexpected{votes.error()};
    }

    FinalityEffects<Submitter> effects;
    VoteCounts outstanding_votes{votes->votes};
    for (const auto& ancestor : votes->ancestry) {
        if (!is_finalized(validator_set, outstanding_votes, ancestor.id.number >= two_thirds_majority_transition)) {
            break;
        }
        remove_signers_votes(ancestor.signers, outstanding_votes);
        effects.finalized_headers.emplace_back(ancestor.id, ancestor.submitter);
        AURA_TRACE_M("Finalized header", {"number", std::to_string(ancestor.id.number),
                                          "hash", to_hex(ancestor.id.hash, /*with_prefix=*/true)});
    }
    effects.votes = std::move(*votes);
    return effects;
}

}  // namespace aurabridge
