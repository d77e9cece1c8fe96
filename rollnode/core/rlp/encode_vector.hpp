// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <numeric>
#include <vector>

#include <rollnode/core/rlp/encode.hpp>

namespace rollnode::rlp {

// std::vector to RLP list

template <typename T>
size_t length_items(const std::vector<T>& v) {
    return std::accumulate(v.begin(), v.end(), size_t{0}, [](size_t sum, const T& x) { return sum + length(x); });
}

template <typename T>
size_t length(const std::vector<T>& v) {
    const size_t payload_length{length_items(v)};
    return length_of_length(payload_length) + payload_length;
}

template <typename T>
void encode(Bytes& to, const std::vector<T>& v) {
    const Header h{.list = true, .payload_length = length_items(v)};
    to.reserve(to.size() + length_of_length(h.payload_length) + h.payload_length);
    encode_header(to, h);
    for (const T& x : v) {
        encode(to, x);
    }
}

// variadic arguments to RLP list

template <typename Arg>
size_t length_items(const Arg& arg) {
    return length(arg);
}

template <typename Arg1, typename Arg2, typename... Args>
size_t length_items(const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    return length(arg1) + length_items(arg2, args...);
}

template <typename Arg1, typename Arg2, typename... Args>
size_t length(const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    const size_t payload_length{length_items(arg1, arg2, args...)};
    return length_of_length(payload_length) + payload_length;
}

template <typename... Args>
void encode_items(Bytes& to, const Args&... args) {
    (encode(to, args), ...);
}

template <typename Arg1, typename Arg2, typename... Args>
void encode(Bytes& to, const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    const Header h{.list = true, .payload_length = length_items(arg1, arg2, args...)};
    to.reserve(to.size() + length_of_length(h.payload_length) + h.payload_length);
    encode_header(to, h);
    encode_items(to, arg1, arg2, args...);
}

}  // namespace rollnode::rlp
