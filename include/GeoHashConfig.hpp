#pragma once

constexpr int BITS_PER_CHAR = 5;
// 12 characters are 60 bits: the longest run that fits one 64-bit code
// while keeping an even number of bits, so lon/lat parity is preserved.
constexpr int MAX_CHARS_PER_BLOCK = 12;
constexpr int DEFAULT_MAX_INFERRED_PRECISION = 12;

struct GeoHashConfig {
    // Ceiling for encode() when no precision is given.
    int maxInferredPrecision = DEFAULT_MAX_INFERRED_PRECISION;
    // Reject NaN and coordinates outside [-90, 90] x [-180, 180].
    bool validateCoordinates = true;
    // Write a line to std::cerr when a try* call swallows an error.
    bool logErrors = true;
};
