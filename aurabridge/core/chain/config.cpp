// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <string>

namespace aurabridge {

constexpr const char* kTwoThirdsMajorityTransition{"twoThirdsMajorityTransition"};
constexpr const char* kFinalityVotesCachingInterval{"finalityVotesCachingInterval"};

static inline void member_to_json(nlohmann::json& json, const std::string& key, const std::optional<uint64_t>& source) {
    if (source.has_value()) {
        json[key] = source.value();
    }
}

static inline bool read_json_config_member(const nlohmann::json& json, const std::string& key,
                                           std::optional<uint64_t>& target) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_number_unsigned()) {
        return false;
    }
    target = json[key].get<uint64_t>();
    return true;
}

nlohmann::json AuraConfig::to_json() const noexcept {
    nlohmann::json ret(nlohmann::json::value_t::object);

    if (two_thirds_majority_transition != kMaxBlockNum) {
        ret[kTwoThirdsMajorityTransition] = two_thirds_majority_transition;
    }
    member_to_json(ret, kFinalityVotesCachingInterval, finality_votes_caching_interval);

    return ret;
}

std::optional<AuraConfig> AuraConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    AuraConfig config{};

    std::optional<uint64_t> transition;
    if (!read_json_config_member(json, kTwoThirdsMajorityTransition, transition)) {
        return std::nullopt;
    }
    config.two_thirds_majority_transition = transition.value_or(kMaxBlockNum);

    if (!read_json_config_member(json, kFinalityVotesCachingInterval, config.finality_votes_caching_interval)) {
        return std::nullopt;
    }
    if (config.finality_votes_caching_interval == 0u) {
        return std::nullopt;
    }

    return config;
}

std::ostream& operator<<(std::ostream& out, const AuraConfig& obj) { return out << obj.to_json(); }

}  // namespace aurabridge
