// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <rollnode/core/common/base.hpp>
#include <rollnode/core/common/bytes.hpp>

namespace rollnode::trie {

// Calculates root hash of a Modified Merkle Patricia Trie from a sorted stream of leaves.
// See Appendix D "Modified Merkle Patricia Trie" of the Yellow Paper
class HashBuilder {
  public:
    HashBuilder() = default;

    // Not copyable nor movable
    HashBuilder(const HashBuilder&) = delete;
    HashBuilder& operator=(const HashBuilder&) = delete;

    //! \details Leaves must be added in the strictly increasing lexicographic order (by key).
    //! The key should be unpacked, i.e. have one nibble per byte.
    //! A leaf key may not be a prefix of another leaf key.
    void add_leaf(Bytes nibbled_key, ByteView value);

    //! \brief Returns the root hash of the added leaves, kEmptyRoot if there are none
    evmc::bytes32 root_hash();

  private:
    void finalize();

    // See Erigon GenStructStep
    void gen_struct_step(ByteView current, ByteView succeeding);

    // Replaces the children on top of the stack with the reference to their branch node
    void branch_ref(uint16_t state_mask);

    ByteView leaf_node_rlp(ByteView path, ByteView value);
    ByteView extension_node_rlp(ByteView path, ByteView child_ref);

    Bytes key_;  // unpacked, one nibble per byte
    Bytes value_;
    std::vector<uint16_t> groups_;
    std::vector<Bytes> stack_;  // node references: hashes or embedded RLPs
    Bytes rlp_buffer_;
};

}  // namespace rollnode::trie
