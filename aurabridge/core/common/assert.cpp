// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <iostream>

namespace aurabridge {

void abort_due_to_assertion_failure(char const* expr, char const* file, int line) {
    std::cerr << "Invariant violated: " << expr << " (" << file << ":" << line << ")" << std::endl;
    std::abort();
}

}  // namespace aurabridge
