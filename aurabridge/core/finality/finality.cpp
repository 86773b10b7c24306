// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "finality.hpp"

namespace aurabridge {

bool is_finalized(const ValidatorSet& validators, const VoteCounts& votes, bool requires_two_thirds_majority) {
    const size_t voters{votes.size()};
    if (requires_two_thirds_majority) {
        return voters * 3 > validators.size() * 2;
    }
    return voters * 2 > validators.size();
}

}  // namespace aurabridge
