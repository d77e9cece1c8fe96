// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash_builder.hpp"

#include <algorithm>
#include <bitset>
#include <cstring>

#include <rollnode/core/common/empty_hashes.hpp>
#include <rollnode/core/common/util.hpp>
#include <rollnode/core/rlp/encode.hpp>
#include <rollnode/core/trie/nibbles.hpp>

namespace rollnode::trie {

static Bytes wrap_hash(const uint8_t* hash) {
    Bytes wrapped(kHashLength + 1, '\0');
    wrapped[0] = rlp::kEmptyStringCode + kHashLength;
    std::memcpy(&wrapped[1], hash, kHashLength);
    return wrapped;
}

// Nodes whose RLP is shorter than 32 bytes are embedded in their parent
static Bytes node_ref(ByteView rlp) {
    if (rlp.size() < kHashLength) {
        return Bytes{rlp};
    }
    const ethash::hash256 hash{keccak256(rlp)};
    return wrap_hash(hash.bytes);
}

ByteView HashBuilder::leaf_node_rlp(ByteView path, ByteView value) {
    const Bytes encoded_path{encode_path(path, /*terminating=*/true)};
    rlp_buffer_.clear();
    rlp::encode_header(rlp_buffer_, {.list = true, .payload_length = rlp::length(encoded_path) + rlp::length(value)});
    rlp::encode(rlp_buffer_, encoded_path);
    rlp::encode(rlp_buffer_, value);
    return rlp_buffer_;
}

ByteView HashBuilder::extension_node_rlp(ByteView path, ByteView child_ref) {
    const Bytes encoded_path{encode_path(path, /*terminating=*/false)};
    rlp_buffer_.clear();
    rlp::encode_header(rlp_buffer_, {.list = true, .payload_length = rlp::length(encoded_path) + child_ref.size()});
    rlp::encode(rlp_buffer_, encoded_path);
    rlp_buffer_.append(child_ref);
    return rlp_buffer_;
}

void HashBuilder::add_leaf(Bytes key, ByteView value) {
    ROLLNODE_ASSERT(key > key_);
    if (!key_.empty()) {
        gen_struct_step(key_, key);
    }
    key_ = std::move(key);
    value_ = Bytes{value};
}

void HashBuilder::finalize() {
    if (!key_.empty()) {
        gen_struct_step(key_, {});
        key_.clear();
        value_.clear();
    }
}

evmc::bytes32 HashBuilder::root_hash() {
    finalize();

    if (stack_.empty()) {
        return kEmptyRoot;
    }

    const Bytes& top{stack_.back()};
    evmc::bytes32 res{};
    if (top.size() == kHashLength + 1) {
        std::memcpy(res.bytes, &top[1], kHashLength);
    } else {
        const ethash::hash256 hash{keccak256(top)};
        std::memcpy(res.bytes, hash.bytes, kHashLength);
    }
    return res;
}

// https://github.com/ledgerwatch/erigon/blob/devel/docs/programmers_guide/guide.md#generating-the-structural-information-from-the-sequence-of-keys
void HashBuilder::gen_struct_step(ByteView current, const ByteView succeeding) {
    for (bool build_extensions{false};; build_extensions = true) {
        const bool preceding_exists{!groups_.empty()};

        // Calculate the prefix of the smallest prefix group containing current
        const size_t preceding_len{groups_.empty() ? 0 : groups_.size() - 1};
        const size_t common_prefix_len{prefix_length(succeeding, current)};
        const size_t len{std::max(preceding_len, common_prefix_len)};
        ROLLNODE_ASSERT(len < current.size());

        // Add the digit immediately following the max common prefix
        const uint8_t extra_digit{current[len]};
        if (groups_.size() <= len) {
            groups_.resize(len + 1);
        }
        groups_[len] |= 1u << extra_digit;

        size_t from{len};
        if (!succeeding.empty() || preceding_exists) {
            ++from;
        }

        const ByteView short_node_key{current.substr(from)};
        if (!build_extensions) {
            stack_.push_back(node_ref(leaf_node_rlp(short_node_key, value_)));
        }

        if (build_extensions && !short_node_key.empty()) {
            stack_.back() = node_ref(extension_node_rlp(short_node_key, stack_.back()));
        }

        // Check for the optional part
        if (preceding_len <= common_prefix_len && !succeeding.empty()) {
            return;
        }

        // Close the immediately encompassing prefix group, if needed
        if (!succeeding.empty() || preceding_exists) {
            branch_ref(groups_[len]);
        }

        groups_.resize(len);

        if (preceding_len == 0) {
            return;
        }

        // Update current key for the build_extensions iteration
        current = current.substr(0, preceding_len);
        while (!groups_.empty() && groups_.back() == 0) {
            groups_.pop_back();
        }
    }
}

void HashBuilder::branch_ref(uint16_t state_mask) {
    const size_t first_child_idx{stack_.size() - std::bitset<16>(state_mask).count()};

    // One byte for the empty value slot
    rlp::Header h{.list = true, .payload_length = 1};
    for (size_t i{first_child_idx}, digit{0}; digit < 16; ++digit) {
        h.payload_length += (state_mask & (1u << digit)) ? stack_[i++].size() : 1;
    }

    rlp_buffer_.clear();
    rlp::encode_header(rlp_buffer_, h);
    for (size_t i{first_child_idx}, digit{0}; digit < 16; ++digit) {
        if (state_mask & (1u << digit)) {
            rlp_buffer_.append(stack_[i++]);
        } else {
            rlp_buffer_.push_back(rlp::kEmptyStringCode);
        }
    }
    // branch nodes with values are not supported
    rlp_buffer_.push_back(rlp::kEmptyStringCode);

    stack_.resize(first_child_idx + 1);
    stack_.back() = node_ref(rlp_buffer_);
}

}  // namespace rollnode::trie
