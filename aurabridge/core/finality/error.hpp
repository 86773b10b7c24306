// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace aurabridge {

enum class [[nodiscard]] FinalityError {
    kNotValidator,  // Header author or empty step signer is not in the validator set
};

inline std::string_view to_string(FinalityError error) {
    switch (error) {
        case FinalityError::kNotValidator:
            return "not a validator";
    }
    return "unknown finality error";
}

}  // namespace aurabridge
