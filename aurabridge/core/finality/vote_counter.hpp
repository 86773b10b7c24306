// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <set>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <aurabridge/core/finality/error.hpp>

namespace aurabridge {

using ValidatorSet = std::set<evmc::address>;

//! Distinct addresses credited for one header
using SignerSet = std::set<evmc::address>;

//! Number of ancestors each validator has signed; zero counts are never stored
using VoteCounts = std::map<evmc::address, uint64_t>;

//! \brief Casts one vote for each of the signers
//! \return FinalityError::kNotValidator at the first signer outside the validator set
//! \remarks Signers preceding the failing one have already been counted when this fails
tl::expected<void, FinalityError> add_signers_votes(const ValidatorSet& validators, const SignerSet& signers,
                                                    VoteCounts& votes);

//! \brief Uncasts one vote for each of the signers
//! \remarks Every signer must have at least one vote recorded, the program aborts otherwise
void remove_signers_votes(const SignerSet& signers, VoteCounts& votes);

}  // namespace aurabridge
