#include <TesseraUtility/Hash.h>

#include <climits>
#include <cstddef>
#include <cstdint>

namespace TesseraUtility {

// The mixing functions below are adapted from Boost v1.86.0 `hash_mix_impl`.
//
// Copyright 2022 Peter Dimov
// Distributed under the Boost Software License, Version 1.0.
// https://www.boost.org/LICENSE_1_0.txt
namespace {

template <size_t Bits> struct hash_mix_impl;

// Jon Maiga's mx3 mixer, http://jonkagstrom.com/mx3/mx3_rev2.html
template <> struct hash_mix_impl<64> {
  inline static uint64_t fn(uint64_t x) {
    uint64_t const m = 0xe9846af9b1a615d;

    x ^= x >> 32;
    x *= m;
    x ^= x >> 32;
    x *= m;
    x ^= x >> 28;

    return x;
  }
};

// https://github.com/skeeto/hash-prospector/issues/19
template <> struct hash_mix_impl<32> {
  inline static uint32_t fn(uint32_t x) {
    uint32_t const m1 = 0x21f0aaad;
    uint32_t const m2 = 0x735a2d97;

    x ^= x >> 16;
    x *= m1;
    x ^= x >> 15;
    x *= m2;
    x ^= x >> 15;

    return x;
  }
};

} // namespace

size_t Hash::combine(size_t first, size_t second) {
  return hash_mix_impl<sizeof(size_t) * CHAR_BIT>::fn(
      first + size_t(0x9e3779b9) + second);
}

} // namespace TesseraUtility
