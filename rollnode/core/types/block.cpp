// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <rollnode/core/common/util.hpp>
#include <rollnode/core/rlp/encode_vector.hpp>
#include <rollnode/core/types/address.hpp>
#include <rollnode/core/types/evmc_bytes32.hpp>

namespace rollnode {

evmc::bytes32 BlockHeader::hash() const {
    Bytes rlp;
    rlp::encode(rlp, *this);
    return to_bytes32(keccak256(rlp));
}

namespace rlp {

    static Header header(const BlockHeader& h) {
        Header rlp_head{.list = true};
        rlp_head.payload_length = length(h.parent_hash);
        rlp_head.payload_length += length(h.ommers_hash);
        rlp_head.payload_length += length(h.beneficiary);
        rlp_head.payload_length += length(h.state_root);
        rlp_head.payload_length += length(h.transactions_root);
        rlp_head.payload_length += length(h.receipts_root);
        rlp_head.payload_length += length(ByteView{h.logs_bloom});
        rlp_head.payload_length += length(h.difficulty);
        rlp_head.payload_length += length(h.number);
        rlp_head.payload_length += length(h.gas_limit);
        rlp_head.payload_length += length(h.gas_used);
        rlp_head.payload_length += length(h.timestamp);
        rlp_head.payload_length += length(h.extra_data);
        rlp_head.payload_length += length(h.mix_hash);
        rlp_head.payload_length += length(ByteView{h.nonce});

        if (h.base_fee_per_gas || h.bls_data) {
            rlp_head.payload_length += length(h.base_fee_per_gas.value_or(0));
        }
        if (h.bls_data) {
            rlp_head.payload_length += length(*h.bls_data);
        }

        return rlp_head;
    }

    size_t length(const BlockHeader& block_header) {
        const Header rlp_head{header(block_header)};
        return length_of_length(rlp_head.payload_length) + rlp_head.payload_length;
    }

    void encode(Bytes& to, const BlockHeader& h) {
        encode_header(to, header(h));
        encode(to, h.parent_hash);
        encode(to, h.ommers_hash);
        encode(to, h.beneficiary);
        encode(to, h.state_root);
        encode(to, h.transactions_root);
        encode(to, h.receipts_root);
        encode(to, ByteView{h.logs_bloom});
        encode(to, h.difficulty);
        encode(to, h.number);
        encode(to, h.gas_limit);
        encode(to, h.gas_used);
        encode(to, h.timestamp);
        encode(to, h.extra_data);
        encode(to, h.mix_hash);
        encode(to, ByteView{h.nonce});
        if (h.base_fee_per_gas || h.bls_data) {
            encode(to, h.base_fee_per_gas.value_or(0));
        }
        if (h.bls_data) {
            encode(to, *h.bls_data);
        }
    }

    static Header header(const BlockBody& b) {
        return {.list = true, .payload_length = length(b.transactions) + length(b.ommers)};
    }

    size_t length(const BlockBody& block_body) {
        const Header rlp_head{header(block_body)};
        return length_of_length(rlp_head.payload_length) + rlp_head.payload_length;
    }

    void encode(Bytes& to, const BlockBody& block_body) {
        encode_header(to, header(block_body));
        encode(to, block_body.transactions);
        encode(to, block_body.ommers);
    }

    void encode(Bytes& to, const Block& block) {
        const Header rlp_head{.list = true,
                              .payload_length = length(block.header) + length(block.transactions) + length(block.ommers)};
        encode_header(to, rlp_head);
        encode(to, block.header);
        encode(to, block.transactions);
        encode(to, block.ommers);
    }

}  // namespace rlp

}  // namespace rollnode
