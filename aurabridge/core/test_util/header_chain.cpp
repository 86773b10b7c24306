// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "header_chain.hpp"

#include <aurabridge/core/common/util.hpp>
#include <aurabridge/core/rlp/encode.hpp>
#include <aurabridge/core/test_util/validators.hpp>
#include <aurabridge/core/types/address.hpp>

namespace aurabridge::test_util {

Header genesis() {
    Header header{
        .author = validator_address(0),
        .difficulty = 0x20000,
        .gas_limit = 0x222222,
        .extra_data = *from_hex("0x617572616272696467652d67656e65736973"),
    };
    seal_header(header, 0, 0);
    return header;
}

Header build_header(const Header& parent, size_t author_index, std::span<const size_t> empty_step_signers) {
    const uint64_t parent_step{parent.step().value_or(0)};

    std::vector<SealedEmptyStep> empty_steps;
    for (size_t i{0}; i < empty_step_signers.size(); ++i) {
        empty_steps.push_back(sealed_empty_step(empty_step_signers[i], parent_step + 1 + i, parent.hash()));
    }

    Header header{
        .parent_hash = parent.hash(),
        .author = validator_address(author_index),
        .difficulty = parent.difficulty,
        .number = parent.number + 1,
        .gas_limit = parent.gas_limit,
        .timestamp = parent.timestamp + 5 * (empty_steps.size() + 1),
    };
    seal_header(header, author_index, parent_step + empty_steps.size() + 1, empty_steps);
    return header;
}

void seal_header(Header& header, size_t author_index, uint64_t step, std::span<const SealedEmptyStep> empty_steps) {
    header.seal.clear();
    const evmc::bytes32 bare_hash{header.hash()};

    Bytes encoded_step;
    rlp::encode(encoded_step, step);
    Bytes encoded_signature;
    rlp::encode(encoded_signature, ByteView{sign(author_index, bare_hash)});

    header.seal.push_back(encoded_step);
    header.seal.push_back(encoded_signature);
    if (!empty_steps.empty()) {
        header.seal.push_back(SealedEmptyStep::rlp_of(empty_steps));
    }
}

std::vector<Header> build_chain(size_t length, std::span<const size_t> authors) {
    std::vector<Header> chain;
    chain.reserve(length + 1);
    chain.push_back(genesis());
    for (size_t i{1}; i <= length; ++i) {
        chain.push_back(build_header(chain.back(), authors[(i - 1) % authors.size()]));
    }
    return chain;
}

}  // namespace aurabridge::test_util
