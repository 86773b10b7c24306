// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <aurabridge/core/common/base.hpp>
#include <aurabridge/core/common/bytes.hpp>
#include <aurabridge/core/rlp/decode.hpp>
#include <aurabridge/core/types/empty_step.hpp>
#include <aurabridge/core/types/header_id.hpp>

namespace aurabridge {

using Bloom = std::array<uint8_t, kBloomByteLength>;

//! \brief Header of a block sealed by the Aura (Authority Round) engine
struct Header {
    evmc::bytes32 parent_hash{};
    evmc::bytes32 uncles_hash{};
    evmc::address author{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom log_bloom{};
    intx::uint256 difficulty{};
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};

    Bytes extra_data{};

    //! Raw RLP items: step, signature and, optionally, the list of sealed empty steps
    std::vector<Bytes> seal{};

    [[nodiscard]] evmc::bytes32 hash() const;

    [[nodiscard]] HeaderId id() const { return {number, hash()}; }

    //! \return The step this header has been sealed at or std::nullopt if the seal does not carry a valid one
    [[nodiscard]] std::optional<uint64_t> step() const;

    //! \return The author's signature or std::nullopt if the seal does not carry a valid one
    [[nodiscard]] std::optional<Signature> signature() const;

    //! \return The empty steps sealed into this header, or std::nullopt if the seal has no valid empty steps list
    [[nodiscard]] std::optional<std::vector<SealedEmptyStep>> empty_steps() const;

    friend bool operator==(const Header&, const Header&) = default;
};

namespace rlp {
    size_t length(const aurabridge::Header&);

    void encode(Bytes& to, const aurabridge::Header&);

    DecodingResult decode(ByteView& from, aurabridge::Header& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace aurabridge
