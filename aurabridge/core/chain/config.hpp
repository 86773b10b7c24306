// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

#include <nlohmann/json.hpp>

#include <aurabridge/core/common/base.hpp>

namespace aurabridge {

//! \brief Finality parameters of an Aura chain
struct AuraConfig {
    //! Number of the first block finalized by a 2/3 supermajority of validators instead of a simple majority
    BlockNum two_thirds_majority_transition{kMaxBlockNum};

    //! Interval (in blocks) at which hosts cache finality votes; std::nullopt means never
    std::optional<uint64_t> finality_votes_caching_interval{std::nullopt};

    //! \brief Return the JSON representation of this object
    [[nodiscard]] nlohmann::json to_json() const noexcept;

    //! \brief Try parse a JSON object into strongly typed AuraConfig
    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<AuraConfig> from_json(const nlohmann::json& json) noexcept;

    friend bool operator==(const AuraConfig&, const AuraConfig&) = default;
};

std::ostream& operator<<(std::ostream& out, const AuraConfig& obj);

}  // namespace aurabridge
