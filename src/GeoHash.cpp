#include "GeoHash.hpp"
#include "Base32Codec.hpp"
#include "BitInterleaver.hpp"
#include "GeoHashError.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

static void validateCoordinates(const Coordinates& coords) {
    bool invalidLatitude = std::isnan(coords.latitude) ||
                           coords.latitude < MIN_LATITUDE || coords.latitude > MAX_LATITUDE;
    bool invalidLongitude = std::isnan(coords.longitude) ||
                            coords.longitude < MIN_LONGITUDE || coords.longitude > MAX_LONGITUDE;

    if (invalidLatitude || invalidLongitude) {
        std::ostringstream err;
        err << "invalid ";
        if (invalidLongitude) err << "longitude";
        if (invalidLongitude && invalidLatitude) err << ",";
        if (invalidLatitude) err << "latitude";
        err << " value (" << coords.latitude << ", " << coords.longitude << ")";
        throw GeoHashError(GeoErrorCode::InvalidCoordinate, err.str());
    }
}

static std::string encodeWithPrecision(const Coordinates& coords, int precision) {
    std::string geohash;
    geohash.reserve(precision);

    BoundingBox box = BoundingBox::world();
    int remaining = precision;
    while (remaining > 0) {
        int chars = std::min(remaining, MAX_CHARS_PER_BLOCK);
        CellCode code = encodeCell(coords, box, chars * BITS_PER_CHAR);
        for (int i = chars - 1; i >= 0; i--) {
            geohash += encode5Bits(static_cast<int>((code.bits >> (i * BITS_PER_CHAR)) & 0x1F));
        }
        remaining -= chars;
    }
    return geohash;
}

std::string encode(const Coordinates& coords, std::optional<int> precision, const GeoHashConfig& config) {
    if (config.validateCoordinates) {
        validateCoordinates(coords);
    }

    if (precision.has_value()) {
        if (precision.value() < 1) {
            throw GeoHashError(GeoErrorCode::InvalidPrecision,
                               "precision must be positive, got " + std::to_string(precision.value()));
        }
        return encodeWithPrecision(coords, precision.value());
    }

    int ceiling = config.maxInferredPrecision;
    if (ceiling < 1) {
        throw GeoHashError(GeoErrorCode::InvalidPrecision,
                           "maxInferredPrecision must be positive, got " + std::to_string(ceiling));
    }

    // refine until the cell centre, as decode() reports it, is the input itself
    for (int p = 1; p <= ceiling; p++) {
        std::string geohash = encodeWithPrecision(coords, p);
        if (decode(geohash) == coords) {
            return geohash;
        }
    }
    return encodeWithPrecision(coords, ceiling);
}

BoundingBox bounds(const std::string& geohash) {
    if (geohash.empty()) {
        throw GeoHashError(GeoErrorCode::EmptyInput, "empty geohash");
    }

    BoundingBox box = BoundingBox::world();
    for (size_t start = 0; start < geohash.size(); start += MAX_CHARS_PER_BLOCK) {
        size_t end = std::min(geohash.size(), start + MAX_CHARS_PER_BLOCK);

        CellCode code;
        for (size_t i = start; i < end; i++) {
            code.bits = (code.bits << BITS_PER_CHAR) | static_cast<uint64_t>(decode5Bits(geohash[i]));
            code.step += BITS_PER_CHAR;
        }
        box = decodeCell(code, box);
    }
    return box;
}

double roundToDecimals(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

static int decimalsForSpan(double span) {
    constexpr int maxDecimals = std::numeric_limits<double>::max_digits10;
    if (!(span > 0)) return maxDecimals;
    double decimals = std::floor(2 - std::log10(span));
    return static_cast<int>(std::min(decimals, static_cast<double>(maxDecimals)));
}

Coordinates decode(const std::string& geohash) {
    BoundingBox box = bounds(geohash);
    Coordinates centre = box.center();

    return {
        roundToDecimals(centre.latitude, decimalsForSpan(box.latitudeSpan())),
        roundToDecimals(centre.longitude, decimalsForSpan(box.longitudeSpan()))
    };
}

Coordinates decodeExact(const std::string& geohash) {
    return bounds(geohash).center();
}

std::optional<BoundingBox> tryBounds(const std::string& geohash, const GeoHashConfig& config) {
    try {
        return bounds(geohash);
    } catch (const GeoHashError& e) {
        if (config.logErrors) {
            std::cerr << "geohash: bounds(\"" << geohash << "\") failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }
}

std::optional<Coordinates> tryDecode(const std::string& geohash, const GeoHashConfig& config) {
    try {
        return decode(geohash);
    } catch (const GeoHashError& e) {
        if (config.logErrors) {
            std::cerr << "geohash: decode(\"" << geohash << "\") failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }
}
