// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <optional>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>

#include <aurabridge/core/common/base.hpp>
#include <aurabridge/core/common/bytes.hpp>
#include <aurabridge/core/common/decoding_result.hpp>
#include <aurabridge/core/finality/vote_counter.hpp>
#include <aurabridge/core/rlp/decode.hpp>
#include <aurabridge/core/rlp/decode_vector.hpp>
#include <aurabridge/core/rlp/encode.hpp>
#include <aurabridge/core/types/address.hpp>
#include <aurabridge/core/types/evmc_bytes32.hpp>
#include <aurabridge/core/types/header.hpp>
#include <aurabridge/core/types/header_id.hpp>

namespace aurabridge {

//! \brief Unfinalized header together with the validators credited for it
template <class Submitter>
struct FinalityAncestor {
    HeaderId id;
    //! Who submitted the header to the host, if known
    std::optional<Submitter> submitter;
    //! The header author plus the empty step signers found in its child
    SignerSet signers;

    friend bool operator==(const FinalityAncestor&, const FinalityAncestor&) = default;
};

//! \brief Vote tally over a contiguous run of unfinalized headers
//! \details Each validator's count equals the number of ancestors whose signers contain it
template <class Submitter>
struct FinalityVotes {
    VoteCounts votes;
    //! Oldest first
    std::deque<FinalityAncestor<Submitter>> ancestry;

    friend bool operator==(const FinalityVotes&, const FinalityVotes&) = default;
};

//! \brief Header walked by the host storage that no cached tally accounts for yet
template <class Submitter>
struct UnaccountedAncestor {
    HeaderId id;
    std::optional<Submitter> submitter;
    Header header;

    friend bool operator==(const UnaccountedAncestor&, const UnaccountedAncestor&) = default;
};

//! \brief Result of the host storage lookup for the nearest cached tally
template <class Submitter>
struct CachedFinalityVotes {
    //! Newest first
    std::deque<UnaccountedAncestor<Submitter>> unaccounted_ancestry;
    //! Tally cached at the parent of the oldest unaccounted ancestor; std::nullopt if the walk found none
    std::optional<FinalityVotes<Submitter>> votes;

    friend bool operator==(const CachedFinalityVotes&, const CachedFinalityVotes&) = default;
};

//! \brief Outcome of importing a header
template <class Submitter>
struct FinalityEffects {
    //! Headers finalized by this import, in ascending order
    std::vector<std::pair<HeaderId, std::optional<Submitter>>> finalized_headers;
    //! Tally including the imported header and the just finalized ancestors
    FinalityVotes<Submitter> votes;

    friend bool operator==(const FinalityEffects&, const FinalityEffects&) = default;
};

//! \brief Recounts the votes cast over the given ancestry
template <class Submitter>
VoteCounts count_votes(const std::deque<FinalityAncestor<Submitter>>& ancestry) {
    VoteCounts votes;
    for (const auto& ancestor : ancestry) {
        for (const auto& signer : ancestor.signers) {
            ++votes[signer];
        }
    }
    return votes;
}

// Finality votes are persisted by the host between imports.
// The encoding is canonical: decoding accepts a single representation for each value.
//
// optional<T>         -> [] or [T]
// FinalityAncestor<S> -> [number, hash, optional<S>, [signer...]]
// FinalityVotes<S>    -> [[[address, count]...], [FinalityAncestor<S>...]]
//
// Submitter must provide rlp length/encode/decode overloads visible at instantiation.
namespace rlp {

    inline size_t list_length(size_t payload_length) noexcept {
        return length_of_length(payload_length) + payload_length;
    }

    template <class T>
    size_t optional_payload_length(const std::optional<T>& value) {
        return value ? length(*value) : 0;
    }

    inline size_t signers_payload_length(const SignerSet& signers) noexcept {
        return signers.size() * (kAddressLength + 1);
    }

    template <class Submitter>
    size_t ancestor_payload_length(const FinalityAncestor<Submitter>& ancestor) {
        return length(ancestor.id.number) + length(ancestor.id.hash) +
               list_length(optional_payload_length(ancestor.submitter)) +
               list_length(signers_payload_length(ancestor.signers));
    }

    template <class Submitter>
    size_t length(const FinalityAncestor<Submitter>& ancestor) {
        return list_length(ancestor_payload_length(ancestor));
    }

    template <class Submitter>
    void encode(Bytes& to, const FinalityAncestor<Submitter>& ancestor) {
        encode_header(to, {.list = true, .payload_length = ancestor_payload_length(ancestor)});
        encode(to, ancestor.id.number);
        encode(to, ancestor.id.hash);
        encode_header(to, {.list = true, .payload_length = optional_payload_length(ancestor.submitter)});
        if (ancestor.submitter) {
            encode(to, *ancestor.submitter);
        }
        encode_header(to, {.list = true, .payload_length = signers_payload_length(ancestor.signers)});
        for (const auto& signer : ancestor.signers) {
            encode(to, signer);
        }
    }

    inline size_t votes_payload_length(const VoteCounts& votes) noexcept {
        size_t payload_length{0};
        for (const auto& [address, count] : votes) {
            payload_length += list_length(length(address) + length(count));
        }
        return payload_length;
    }

    template <class Submitter>
    size_t ancestry_payload_length(const std::deque<FinalityAncestor<Submitter>>& ancestry) {
        size_t payload_length{0};
        for (const auto& ancestor : ancestry) {
            payload_length += length(ancestor);
        }
        return payload_length;
    }

    template <class Submitter>
    size_t length(const FinalityVotes<Submitter>& votes) {
        return list_length(list_length(votes_payload_length(votes.votes)) +
                           list_length(ancestry_payload_length(votes.ancestry)));
    }

    template <class Submitter>
    void encode(Bytes& to, const FinalityVotes<Submitter>& votes) {
        const size_t votes_payload{votes_payload_length(votes.votes)};
        const size_t ancestry_payload{ancestry_payload_length(votes.ancestry)};
        to.reserve(to.size() + list_length(list_length(votes_payload) + list_length(ancestry_payload)));

        encode_header(to, {.list = true, .payload_length = list_length(votes_payload) + list_length(ancestry_payload)});
        encode_header(to, {.list = true, .payload_length = votes_payload});
        for (const auto& [address, count] : votes.votes) {
            encode_header(to, {.list = true, .payload_length = length(address) + length(count)});
            encode(to, address);
            encode(to, count);
        }
        encode_header(to, {.list = true, .payload_length = ancestry_payload});
        for (const auto& ancestor : votes.ancestry) {
            encode(to, ancestor);
        }
    }

    template <class T>
    DecodingResult decode_optional(ByteView& from, std::optional<T>& to) noexcept {
        auto payload{decode_list_payload(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        to.reset();
        if (payload->empty()) {
            return {};
        }
        T value{};
        if (DecodingResult res{decode(*payload, value, Leftover::kAllow)}; !res) {
            return res;
        }
        if (!payload->empty()) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        to = std::move(value);
        return {};
    }

    inline DecodingResult decode_signers(ByteView& from, SignerSet& to) noexcept {
        auto payload{decode_list_payload(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        to.clear();
        while (!payload->empty()) {
            evmc::address signer;
            if (DecodingResult res{decode(*payload, signer, Leftover::kAllow)}; !res) {
                return res;
            }
            if (!to.empty() && !(*to.rbegin() < signer)) {
                return tl::unexpected{DecodingError::kNonCanonicalOrder};
            }
            to.insert(to.end(), signer);
        }
        return {};
    }

    template <class Submitter>
    DecodingResult decode(ByteView& from, FinalityAncestor<Submitter>& to, Leftover mode = Leftover::kProhibit) noexcept {
        auto payload{decode_list_payload(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{decode(*payload, to.id.number, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(*payload, to.id.hash, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_optional(*payload, to.submitter)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_signers(*payload, to.signers)}; !res) {
            return res;
        }
        if (!payload->empty()) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        if (mode != Leftover::kAllow && !from.empty()) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }
        return {};
    }

    inline DecodingResult decode_vote_counts(ByteView& from, VoteCounts& to) noexcept {
        auto payload{decode_list_payload(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        to.clear();
        while (!payload->empty()) {
            evmc::address address;
            uint64_t count{0};
            if (DecodingResult res{decode(*payload, Leftover::kAllow, address, count)}; !res) {
                return res;
            }
            if (count == 0) {
                return tl::unexpected{DecodingError::kInvalidFieldset};
            }
            if (!to.empty() && !(to.rbegin()->first < address)) {
                return tl::unexpected{DecodingError::kNonCanonicalOrder};
            }
            to.emplace_hint(to.end(), address, count);
        }
        return {};
    }

    template <class Submitter>
    DecodingResult decode(ByteView& from, FinalityVotes<Submitter>& to, Leftover mode = Leftover::kProhibit) noexcept {
        auto payload{decode_list_payload(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{decode_vote_counts(*payload, to.votes)}; !res) {
            return res;
        }

        auto ancestry_payload{decode_list_payload(*payload)};
        if (!ancestry_payload) {
            return tl::unexpected{ancestry_payload.error()};
        }
        to.ancestry.clear();
        while (!ancestry_payload->empty()) {
            FinalityAncestor<Submitter> ancestor;
            if (DecodingResult res{decode(*ancestry_payload, ancestor, Leftover::kAllow)}; !res) {
                return res;
            }
            if (!to.ancestry.empty() && ancestor.id.number != to.ancestry.back().id.number + 1) {
                return tl::unexpected{DecodingError::kInvalidFieldset};
            }
            to.ancestry.push_back(std::move(ancestor));
        }

        if (!payload->empty()) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        if (to.votes != count_votes(to.ancestry)) {
            return tl::unexpected{DecodingError::kInvalidFieldset};
        }
        if (mode != Leftover::kAllow && !from.empty()) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }
        return {};
    }

}  // namespace rlp

}  // namespace aurabridge
