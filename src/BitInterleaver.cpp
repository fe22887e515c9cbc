#include "BitInterleaver.hpp"

uint64_t spreadInt32ToInt64(uint32_t v) {
    uint64_t result = v;
    result = (result | (result << 16)) & 0x0000FFFF0000FFFFULL;
    result = (result | (result << 8))  & 0x00FF00FF00FF00FFULL;
    result = (result | (result << 4))  & 0x0F0F0F0F0F0F0F0FULL;
    result = (result | (result << 2))  & 0x3333333333333333ULL;
    result = (result | (result << 1))  & 0x5555555555555555ULL;
    return result;
}

uint32_t compactInt64ToInt32(uint64_t v) {
    v = v & 0x5555555555555555ULL;
    v = (v | (v >> 1))  & 0x3333333333333333ULL;
    v = (v | (v >> 2))  & 0x0F0F0F0F0F0F0F0FULL;
    v = (v | (v >> 4))  & 0x00FF00FF00FF00FFULL;
    v = (v | (v >> 8))  & 0x0000FFFF0000FFFFULL;
    v = (v | (v >> 16)) & 0x00000000FFFFFFFFULL;
    return static_cast<uint32_t>(v);
}

uint64_t interleave(uint32_t x, uint32_t y) {
    return spreadInt32ToInt64(x) | (spreadInt32ToInt64(y) << 1);
}

void deinterleave(uint64_t code, uint32_t& x, uint32_t& y) {
    x = compactInt64ToInt32(code);
    y = compactInt64ToInt32(code >> 1);
}

static uint32_t bisect(double value, double& min, double& max, int bits) {
    uint32_t gridNumber = 0;
    for (int i = 0; i < bits; i++) {
        double mid = (min + max) / 2;
        if (value > mid) {
            gridNumber = (gridNumber << 1) | 1;
            min = mid;
        } else {
            gridNumber = gridNumber << 1;
            max = mid;
        }
    }
    return gridNumber;
}

static void narrow(uint32_t gridNumber, double& min, double& max, int bits) {
    for (int i = bits - 1; i >= 0; i--) {
        double mid = (min + max) / 2;
        if ((gridNumber >> i) & 1) {
            min = mid;
        } else {
            max = mid;
        }
    }
}

// The first bit is longitude, so longitude takes the odd (upper) lane.
static int longitudeBits(int step) { return (step + 1) / 2; }
static int latitudeBits(int step) { return step / 2; }

CellCode encodeCell(const Coordinates& coords, BoundingBox& box, int step) {
    int lonBits = longitudeBits(step);
    int latBits = latitudeBits(step);

    uint32_t lonNumber = bisect(coords.longitude, box.sw.longitude, box.ne.longitude, lonBits);
    uint32_t latNumber = bisect(coords.latitude, box.sw.latitude, box.ne.latitude, latBits);

    // Left-align both grid numbers so the first bisection lands on bit 63.
    uint32_t lonAligned = static_cast<uint32_t>(static_cast<uint64_t>(lonNumber) << (32 - lonBits));
    uint32_t latAligned = static_cast<uint32_t>(static_cast<uint64_t>(latNumber) << (32 - latBits));

    CellCode code;
    code.bits = interleave(latAligned, lonAligned) >> (64 - step);
    code.step = step;
    return code;
}

BoundingBox decodeCell(const CellCode& code, const BoundingBox& box) {
    int lonBits = longitudeBits(code.step);
    int latBits = latitudeBits(code.step);

    uint32_t latAligned = 0;
    uint32_t lonAligned = 0;
    deinterleave(code.bits << (64 - code.step), latAligned, lonAligned);

    uint32_t lonNumber = static_cast<uint32_t>(static_cast<uint64_t>(lonAligned) >> (32 - lonBits));
    uint32_t latNumber = static_cast<uint32_t>(static_cast<uint64_t>(latAligned) >> (32 - latBits));

    BoundingBox result = box;
    narrow(lonNumber, result.sw.longitude, result.ne.longitude, lonBits);
    narrow(latNumber, result.sw.latitude, result.ne.latitude, latBits);
    return result;
}
