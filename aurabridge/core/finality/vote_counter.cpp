// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "vote_counter.hpp"

#include <aurabridge/core/common/assert.hpp>
#include <aurabridge/core/types/address.hpp>
#include <aurabridge/infra/common/log.hpp>

namespace aurabridge {

tl::expected<void, FinalityError> add_signers_votes(const ValidatorSet& validators, const SignerSet& signers,
                                                    VoteCounts& votes) {
    for (const auto& signer : signers) {
        if (!validators.contains(signer)) {
            AURA_DEBUG_M("Rejected vote", {"signer", address_to_hex(signer)});
            return tl::unexpected{FinalityError::kNotValidator};
        }
        ++votes[signer];
    }
    return {};
}

void remove_signers_votes(const SignerSet& signers, VoteCounts& votes) {
    for (const auto& signer : signers) {
        auto it{votes.find(signer)};
        AURABRIDGE_ASSERT(it != votes.end());
        if (--it->second == 0) {
            votes.erase(it);
        }
    }
}

}  // namespace aurabridge
