// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "empty_step.hpp"

#include <bit>

#include <aurabridge/core/common/util.hpp>
#include <aurabridge/core/rlp/decode_vector.hpp>
#include <aurabridge/core/rlp/encode_vector.hpp>
#include <aurabridge/core/types/evmc_bytes32.hpp>

namespace aurabridge {

evmc::bytes32 SealedEmptyStep::message(const evmc::bytes32& parent_hash) const {
    Bytes encoded;
    rlp::encode(encoded, step, parent_hash);
    return std::bit_cast<evmc_bytes32>(keccak256(encoded));
}

Bytes SealedEmptyStep::rlp_of(std::span<const SealedEmptyStep> empty_steps) {
    rlp::Header h{.list = true};
    for (const auto& empty_step : empty_steps) {
        h.payload_length += rlp::length(empty_step);
    }
    Bytes out;
    out.reserve(rlp::length_of_length(h.payload_length) + h.payload_length);
    rlp::encode_header(out, h);
    for (const auto& empty_step : empty_steps) {
        rlp::encode(out, empty_step);
    }
    return out;
}

namespace rlp {

    static Header rlp_header(const SealedEmptyStep& empty_step) noexcept {
        return {.list = true, .payload_length = length(ByteView{empty_step.signature}) + length(empty_step.step)};
    }

    size_t length(const SealedEmptyStep& empty_step) noexcept {
        const Header h{rlp_header(empty_step)};
        return length_of_length(h.payload_length) + h.payload_length;
    }

    void encode(Bytes& to, const SealedEmptyStep& empty_step) {
        encode_header(to, rlp_header(empty_step));
        encode(to, ByteView{empty_step.signature});
        encode(to, empty_step.step);
    }

    DecodingResult decode(ByteView& from, SealedEmptyStep& to, Leftover mode) noexcept {
        return decode(from, mode, to.signature, to.step);
    }

    DecodingResult decode(ByteView& from, std::vector<SealedEmptyStep>& to, Leftover mode) noexcept {
        const auto h{decode_header(from)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        if (!h->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }

        to.clear();

        ByteView payload_view{from.substr(0, h->payload_length)};
        while (!payload_view.empty()) {
            if (DecodingResult res{decode(payload_view, to.emplace_back(), Leftover::kAllow)}; !res) {
                return res;
            }
        }

        from.remove_prefix(h->payload_length);
        if (mode != Leftover::kAllow && !from.empty()) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }
        return {};
    }

}  // namespace rlp

}  // namespace aurabridge
