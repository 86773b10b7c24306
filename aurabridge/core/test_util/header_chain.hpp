// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <span>
#include <vector>

#include <aurabridge/core/types/header.hpp>

namespace aurabridge::test_util {

//! Genesis header of the test chains, sealed at step 0 by validator 0
Header genesis();

//! \brief Builds and seals a child of \p parent authored by the test validator at \p author_index
//! \details The child step is the parent step plus one for each empty step plus one
Header build_header(const Header& parent, size_t author_index, std::span<const size_t> empty_step_signers = {});

//! \brief Seals \p header for its author, replacing any existing seal
void seal_header(Header& header, size_t author_index, uint64_t step, std::span<const SealedEmptyStep> empty_steps = {});

//! \brief Chain of headers starting at genesis; authors rotate over the given validator indices
std::vector<Header> build_chain(size_t length, std::span<const size_t> authors);

}  // namespace aurabridge::test_util
