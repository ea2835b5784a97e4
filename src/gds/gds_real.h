/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include <cstdint>
#include <span>

namespace gds::stream {

/**
 * GDSII 8-byte real (IBM System/370 style):
 *
 *   SEEEEEEE MMMMMMMM MMMMMMMM MMMMMMMM MMMMMMMM MMMMMMMM MMMMMMMM MMMMMMMM
 *
 * value = (-1)^S * (M / 2^56) * 16^(E - 64). All bits zero is true zero.
 */
struct Real8Parts {
    bool negative = false;
    int exponent16 = 0;           // unbiased, base 16
    std::uint64_t fraction = 0;   // 56 significant bits, binary point left of bit 55
};

inline constexpr int kReal8ExponentBias = 64;
inline constexpr int kReal8FractionBits = 56;

Real8Parts decompose_real8(std::span<const std::uint8_t, 8> bytes);

// Pure and total: every 8-byte input yields a finite double.
double real8_to_double(std::span<const std::uint8_t, 8> bytes);

}  // namespace gds::stream
