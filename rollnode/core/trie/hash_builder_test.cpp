// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash_builder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rollnode/core/common/empty_hashes.hpp>
#include <rollnode/core/common/util.hpp>
#include <rollnode/core/trie/nibbles.hpp>

namespace rollnode::trie {

TEST_CASE("Empty trie", "[rollnode][core][trie]") {
    HashBuilder hb;
    CHECK(hb.root_hash() == kEmptyRoot);
}

TEST_CASE("Hex-prefix path encoding", "[rollnode][core][trie]") {
    CHECK(to_hex(encode_path(Bytes{0x1, 0x2, 0x3, 0x4, 0x5}, false)) == "112345");
    CHECK(to_hex(encode_path(Bytes{0x0, 0x1, 0x2, 0x3, 0x4, 0x5}, false)) == "00012345");
    CHECK(to_hex(encode_path(Bytes{0x0, 0xf, 0x1, 0xc, 0xb, 0x8}, true)) == "200f1cb8");
    CHECK(to_hex(encode_path(Bytes{0xf, 0x1, 0xc, 0xb, 0x8}, true)) == "3f1cb8");
}

TEST_CASE("Single leaf and branch under extension", "[rollnode][core][trie]") {
    const Bytes key0{*from_hex("646f")};      // "do"
    const Bytes val0{*from_hex("76657262")};  // "verb"

    // A lone leaf carries the whole path
    const Bytes leaf_rlp{*from_hex("c98320") + key0 + *from_hex("84") + val0};
    HashBuilder hb0;
    hb0.add_leaf(unpack_nibbles(key0), val0);
    CHECK(to_hex(hb0.root_hash()) == to_hex(keccak256(leaf_rlp).bytes));

    const Bytes key1{*from_hex("676f6f64")};    // "good"
    const Bytes val1{*from_hex("7075707079")};  // "puppy"

    // Both leaves are short enough to be embedded in the branch
    const Bytes leaf0_rlp{*from_hex("c882206f84") + val0};
    const Bytes leaf1_rlp{*from_hex("cb84206f6f6485") + val1};
    const Bytes branch_rlp{*from_hex("e480808080") + leaf0_rlp + *from_hex("8080") + leaf1_rlp +
                           *from_hex("808080808080808080")};
    REQUIRE(branch_rlp.size() >= kHashLength);

    // Shared nibble 6 becomes an extension over the branch hash
    Bytes extension_rlp{*from_hex("e216a0")};
    extension_rlp.append(ByteView{keccak256(branch_rlp).bytes});

    HashBuilder hb1;
    hb1.add_leaf(unpack_nibbles(key0), val0);
    hb1.add_leaf(unpack_nibbles(key1), val1);
    CHECK(to_hex(hb1.root_hash()) == to_hex(keccak256(extension_rlp).bytes));
}

}  // namespace rollnode::trie
