#pragma once
#include <cstdint>
#include "GeoTypes.hpp"

uint64_t spreadInt32ToInt64(uint32_t v);
uint32_t compactInt64ToInt32(uint64_t v);

// Bits of x land on even positions, bits of y on odd positions.
uint64_t interleave(uint32_t x, uint32_t y);
void deinterleave(uint64_t code, uint32_t& x, uint32_t& y);

struct CellCode {
    uint64_t bits = 0;
    int step = 0;
};

// Longitude first, MSB first. `box` is narrowed to the cell; a midpoint goes low.
CellCode encodeCell(const Coordinates& coords, BoundingBox& box, int step);

// Inverse of encodeCell: narrows `box` to the cell named by `code`.
BoundingBox decodeCell(const CellCode& code, const BoundingBox& box);
