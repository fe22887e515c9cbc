#define BOOST_TEST_MODULE bit_interleaver
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "BitInterleaver.hpp"

BOOST_AUTO_TEST_CASE(spread_and_compact_are_inverse) {
    uint32_t values[] = { 0u, 1u, 0x5u, 0xFFFFu, 0x12345678u, 0xFFFFFFFFu };
    for (uint32_t v : values) {
        BOOST_CHECK_EQUAL(compactInt64ToInt32(spreadInt32ToInt64(v)), v);
    }
    BOOST_CHECK_EQUAL(spreadInt32ToInt64(0xFFFFFFFFu), 0x5555555555555555ULL);
}

BOOST_AUTO_TEST_CASE(interleave_puts_y_on_odd_bits) {
    BOOST_CHECK_EQUAL(interleave(1u, 0u), 1ULL);
    BOOST_CHECK_EQUAL(interleave(0u, 1u), 2ULL);
    BOOST_CHECK_EQUAL(interleave(0xFFFFFFFFu, 0xFFFFFFFFu), 0xFFFFFFFFFFFFFFFFULL);

    uint32_t x = 0, y = 0;
    deinterleave(interleave(0xCAFEu, 0xBEEFu), x, y);
    BOOST_CHECK_EQUAL(x, 0xCAFEu);
    BOOST_CHECK_EQUAL(y, 0xBEEFu);
}

BOOST_AUTO_TEST_CASE(first_bit_is_longitude) {
    // east of the prime meridian, south of the equator
    BoundingBox box = BoundingBox::world();
    CellCode code = encodeCell({ -10.0, 10.0 }, box, 2);
    BOOST_CHECK_EQUAL(code.step, 2);
    BOOST_CHECK_EQUAL(code.bits, 0x2ULL);
    BOOST_CHECK_EQUAL(box.sw.longitude, 0.0);
    BOOST_CHECK_EQUAL(box.ne.longitude, 180.0);
    BOOST_CHECK_EQUAL(box.sw.latitude, -90.0);
    BOOST_CHECK_EQUAL(box.ne.latitude, 0.0);
}

BOOST_AUTO_TEST_CASE(midpoint_goes_to_lower_half) {
    BoundingBox box = BoundingBox::world();
    CellCode code = encodeCell({ 0.0, 0.0 }, box, 5);
    // lon 0 -> 0, lat 0 -> 0, then both in the upper half of the lower half
    BOOST_CHECK_EQUAL(code.bits, 0x7ULL);
}

BOOST_AUTO_TEST_CASE(odd_step_carries_extra_longitude_bit) {
    BoundingBox box = BoundingBox::world();
    CellCode code = encodeCell({ 57.648, 10.410 }, box, 5);
    // 'u' is index 26 = 11010
    BOOST_CHECK_EQUAL(code.bits, 26ULL);
    BOOST_CHECK_EQUAL(box.sw.longitude, 0.0);
    BOOST_CHECK_EQUAL(box.ne.longitude, 45.0);
    BOOST_CHECK_EQUAL(box.sw.latitude, 45.0);
    BOOST_CHECK_EQUAL(box.ne.latitude, 90.0);
}

BOOST_AUTO_TEST_CASE(decode_cell_matches_encode_cell_box) {
    Coordinates points[] = { { 57.648, 10.410 }, { -25.38262, -49.26561 }, { 0.0, 0.0 },
                             { 90.0, 180.0 }, { -90.0, -180.0 }, { 1e-9, -1e-9 } };
    int steps[] = { 1, 5, 13, 30, 45, 60, 63, 64 };
    for (const Coordinates& p : points) {
        for (int step : steps) {
            BoundingBox encoded = BoundingBox::world();
            CellCode code = encodeCell(p, encoded, step);
            BoundingBox decoded = decodeCell(code, BoundingBox::world());
            BOOST_CHECK(decoded == encoded);
            BOOST_CHECK(decoded.contains(p));
        }
    }
}

BOOST_AUTO_TEST_CASE(decode_cell_refines_given_box) {
    BoundingBox outer = BoundingBox::world();
    encodeCell({ 57.648, 10.410 }, outer, 60);

    BoundingBox inner = outer;
    CellCode code = encodeCell({ 57.648, 10.410 }, inner, 15);
    BOOST_CHECK(decodeCell(code, outer) == inner);
    BOOST_CHECK(inner.latitudeSpan() < outer.latitudeSpan());
    BOOST_CHECK(inner.sw.latitude >= outer.sw.latitude);
    BOOST_CHECK(inner.ne.longitude <= outer.ne.longitude);
}
