/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_real.h"

#include <cmath>

namespace gds::stream {

Real8Parts decompose_real8(std::span<const std::uint8_t, 8> bytes) {
    Real8Parts parts{};
    parts.negative = (bytes[0] & 0x80u) != 0;
    parts.exponent16 = static_cast<int>(bytes[0] & 0x7Fu) - kReal8ExponentBias;
    std::uint64_t fraction = 0;
    for (std::size_t i = 1; i < 8; i++) {
        fraction = (fraction << 8) | static_cast<std::uint64_t>(bytes[i]);
    }
    parts.fraction = fraction;
    return parts;
}

double real8_to_double(std::span<const std::uint8_t, 8> bytes) {
    const Real8Parts parts = decompose_real8(bytes);
    // 16^e == 2^(4e). Scaling the integer fraction with ldexp keeps the full
    // exponent range (2^-312 .. 2^252) finite and rounds only once.
    const int exponent2 = 4 * parts.exponent16 - kReal8FractionBits;
    const double magnitude = std::ldexp(static_cast<double>(parts.fraction), exponent2);
    return parts.negative ? -magnitude : magnitude;
}

}  // namespace gds::stream
