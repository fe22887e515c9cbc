#pragma once
#include <string>
#include <optional>
#include "GeoTypes.hpp"
#include "GeoHashConfig.hpp"

// Without a precision, the shortest hash that decodes back to `coords` exactly.
std::string encode(const Coordinates& coords, std::optional<int> precision = std::nullopt,
                   const GeoHashConfig& config = GeoHashConfig{});

BoundingBox bounds(const std::string& geohash);

// Cell centre rounded per axis to floor(2 - log10(span)) decimals.
Coordinates decode(const std::string& geohash);

// Unrounded centre of the cell.
Coordinates decodeExact(const std::string& geohash);

std::optional<BoundingBox> tryBounds(const std::string& geohash, const GeoHashConfig& config = GeoHashConfig{});
std::optional<Coordinates> tryDecode(const std::string& geohash, const GeoHashConfig& config = GeoHashConfig{});

double roundToDecimals(double value, int decimals);
