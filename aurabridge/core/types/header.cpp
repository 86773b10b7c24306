// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "header.hpp"

#include <bit>

#include <aurabridge/core/common/util.hpp>
#include <aurabridge/core/types/address.hpp>
#include <aurabridge/core/types/evmc_bytes32.hpp>

namespace aurabridge {

namespace {
    constexpr size_t kStepSlot{0};
    constexpr size_t kSignatureSlot{1};
    constexpr size_t kEmptyStepsSlot{2};
}  // namespace

evmc::bytes32 Header::hash() const {
    Bytes rlp;
    rlp::encode(rlp, *this);
    return std::bit_cast<evmc_bytes32>(keccak256(rlp));
}

std::optional<uint64_t> Header::step() const {
    if (seal.size() <= kStepSlot) {
        return std::nullopt;
    }
    ByteView from{seal[kStepSlot]};
    uint64_t step{0};
    if (!rlp::decode(from, step)) {
        return std::nullopt;
    }
    return step;
}

std::optional<Signature> Header::signature() const {
    if (seal.size() <= kSignatureSlot) {
        return std::nullopt;
    }
    ByteView from{seal[kSignatureSlot]};
    Signature signature{};
    if (!rlp::decode(from, signature)) {
        return std::nullopt;
    }
    return signature;
}

std::optional<std::vector<SealedEmptyStep>> Header::empty_steps() const {
    if (seal.size() <= kEmptyStepsSlot) {
        return std::nullopt;
    }
    ByteView from{seal[kEmptyStepsSlot]};
    std::vector<SealedEmptyStep> empty_steps;
    if (!rlp::decode(from, empty_steps)) {
        return std::nullopt;
    }
    return empty_steps;
}

namespace rlp {

    static Header rlp_header(const aurabridge::Header& header) {
        Header rlp_head{.list = true};
        rlp_head.payload_length += kHashLength + 1;                                        // parent_hash
        rlp_head.payload_length += kHashLength + 1;                                        // uncles_hash
        rlp_head.payload_length += kAddressLength + 1;                                     // author
        rlp_head.payload_length += kHashLength + 1;                                        // state_root
        rlp_head.payload_length += kHashLength + 1;                                        // transactions_root
        rlp_head.payload_length += kHashLength + 1;                                        // receipts_root
        rlp_head.payload_length += kBloomByteLength + length_of_length(kBloomByteLength);  // log_bloom
        rlp_head.payload_length += length(header.difficulty);                              // difficulty
        rlp_head.payload_length += length(header.number);                                  // block height
        rlp_head.payload_length += length(header.gas_limit);                               // gas_limit
        rlp_head.payload_length += length(header.gas_used);                                // gas_used
        rlp_head.payload_length += length(header.timestamp);                               // timestamp
        rlp_head.payload_length += length(header.extra_data);                              // extra_data
        for (const auto& item : header.seal) {
            rlp_head.payload_length += item.length();  // already encoded
        }
        return rlp_head;
    }

    size_t length(const aurabridge::Header& header) {
        const Header rlp_head{rlp_header(header)};
        return length_of_length(rlp_head.payload_length) + rlp_head.payload_length;
    }

    void encode(Bytes& to, const aurabridge::Header& header) {
        encode_header(to, rlp_header(header));
        encode(to, header.parent_hash);
        encode(to, header.uncles_hash);
        encode(to, header.author);
        encode(to, header.state_root);
        encode(to, header.transactions_root);
        encode(to, header.receipts_root);
        encode(to, ByteView{header.log_bloom});
        encode(to, header.difficulty);
        encode(to, header.number);
        encode(to, header.gas_limit);
        encode(to, header.gas_used);
        encode(to, header.timestamp);
        encode(to, header.extra_data);
        for (const auto& item : header.seal) {
            to.append(item);
        }
    }

    DecodingResult decode(ByteView& from, aurabridge::Header& to, Leftover mode) noexcept {
        const auto rlp_head{decode_header(from)};
        if (!rlp_head) {
            return tl::unexpected{rlp_head.error()};
        }
        if (!rlp_head->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        const uint64_t leftover{from.length() - rlp_head->payload_length};
        if (mode != Leftover::kAllow && leftover) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }

        if (DecodingResult res{decode(from, to.parent_hash, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.uncles_hash, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.author, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.state_root, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.transactions_root, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.receipts_root, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.log_bloom, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.difficulty, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.number, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.gas_limit, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.gas_used, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.timestamp, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(from, to.extra_data, Leftover::kAllow)}; !res) {
            return res;
        }

        to.seal.clear();
        while (from.length() > leftover) {
            const auto item{decode_raw_item(from)};
            if (!item) {
                return tl::unexpected{item.error()};
            }
            to.seal.emplace_back(*item);
        }

        if (from.length() != leftover) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        return {};
    }

}  // namespace rlp

}  // namespace aurabridge
