// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>

#include <evmc/evmc.hpp>

#include <aurabridge/core/finality/votes.hpp>

namespace aurabridge {

//! \brief Host side store of imported headers and cached finality votes
template <class Submitter>
class FinalityStorage {
  public:
    using StopPredicate = std::function<bool(const evmc::bytes32&)>;

    virtual ~FinalityStorage() = default;

    //! \brief Walks parent links backwards starting at \p parent_hash looking for cached votes
    //! \details The walk stops when stop_at returns true for a hash, when a header is unknown or is the genesis
    //! (votes is std::nullopt in these cases) or when votes are cached for a hash. Every header visited before
    //! stopping is returned in unaccounted_ancestry, newest first; the header owning the cached votes is not.
    [[nodiscard]] virtual CachedFinalityVotes<Submitter> cached_finality_votes(const evmc::bytes32& parent_hash,
                                                                               const StopPredicate& stop_at) const = 0;
};

}  // namespace aurabridge
