// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "empty_steps.hpp"

#include <string>

#include <aurabridge/core/crypto/ecdsa.hpp>
#include <aurabridge/core/types/evmc_bytes32.hpp>
#include <aurabridge/infra/common/log.hpp>

namespace aurabridge {

std::optional<evmc::address> empty_step_signer(const SealedEmptyStep& empty_step, const evmc::bytes32& parent_hash) {
    return ecdsa::recover_address(empty_step.message(parent_hash), ByteView{empty_step.signature});
}

SignerSet empty_steps_signers(const Header& header) {
    SignerSet signers;
    const auto empty_steps{header.empty_steps()};
    if (!empty_steps) {
        return signers;
    }
    for (const auto& empty_step : *empty_steps) {
        const auto signer{empty_step_signer(empty_step, header.parent_hash)};
        if (!signer) {
            AURA_WARN_M("Unrecoverable empty step signature",
                        {"number", std::to_string(header.number),
                         "step", std::to_string(empty_step.step),
                         "parent", to_hex(header.parent_hash, /*with_prefix=*/true)});
            continue;
        }
        signers.insert(*signer);
    }
    return signers;
}

}  // namespace aurabridge
