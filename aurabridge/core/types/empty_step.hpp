// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <span>
#include <vector>

#include <evmc/evmc.hpp>

#include <aurabridge/core/common/base.hpp>
#include <aurabridge/core/common/bytes.hpp>
#include <aurabridge/core/rlp/decode.hpp>

namespace aurabridge {

using Signature = std::array<uint8_t, kSignatureLength>;

//! \brief A validator's signed attestation that its proposal slot (step) was skipped
struct SealedEmptyStep {
    Signature signature{};
    uint64_t step{0};

    //! \brief Hash of the RLP list [step, parent_hash] that the validator has signed
    evmc::bytes32 message(const evmc::bytes32& parent_hash) const;

    //! \brief Builds the header seal item carrying the given empty steps
    static Bytes rlp_of(std::span<const SealedEmptyStep> empty_steps);

    friend bool operator==(const SealedEmptyStep&, const SealedEmptyStep&) = default;
};

namespace rlp {
    size_t length(const SealedEmptyStep&) noexcept;
    void encode(Bytes& to, const SealedEmptyStep&);
    DecodingResult decode(ByteView& from, SealedEmptyStep& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, std::vector<SealedEmptyStep>& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace aurabridge
