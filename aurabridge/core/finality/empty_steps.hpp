// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <aurabridge/core/finality/vote_counter.hpp>
#include <aurabridge/core/types/empty_step.hpp>
#include <aurabridge/core/types/header.hpp>

namespace aurabridge {

//! \brief Recovers the validator which sealed an empty step on top of \p parent_hash
//! \return std::nullopt if the signature is not recoverable
std::optional<evmc::address> empty_step_signer(const SealedEmptyStep& empty_step, const evmc::bytes32& parent_hash);

//! \brief Collects the distinct signers of the empty steps sealed into \p header
//! \remarks Empty steps with unrecoverable signatures are skipped. No membership check is done here
SignerSet empty_steps_signers(const Header& header);

}  // namespace aurabridge
