#pragma once
#include <string>
#include <optional>
#include <vector>

constexpr double MIN_LATITUDE = -90.0;
constexpr double MAX_LATITUDE = 90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;

constexpr double LATITUDE_RANGE = MAX_LATITUDE - MIN_LATITUDE;
constexpr double LONGITUDE_RANGE = MAX_LONGITUDE - MIN_LONGITUDE;

struct Coordinates {
    double latitude;
    double longitude;
};

inline bool operator==(const Coordinates& a, const Coordinates& b) {
    return a.latitude == b.latitude && a.longitude == b.longitude;
}

inline bool operator!=(const Coordinates& a, const Coordinates& b) {
    return !(a == b);
}

struct BoundingBox {
    Coordinates sw;
    Coordinates ne;

    static BoundingBox world() {
        return { { MIN_LATITUDE, MIN_LONGITUDE }, { MAX_LATITUDE, MAX_LONGITUDE } };
    }

    Coordinates center() const {
        return { (sw.latitude + ne.latitude) / 2, (sw.longitude + ne.longitude) / 2 };
    }

    double latitudeSpan() const { return ne.latitude - sw.latitude; }
    double longitudeSpan() const { return ne.longitude - sw.longitude; }

    bool contains(const Coordinates& c) const {
        return c.latitude >= sw.latitude && c.latitude <= ne.latitude &&
               c.longitude >= sw.longitude && c.longitude <= ne.longitude;
    }
};

inline bool operator==(const BoundingBox& a, const BoundingBox& b) {
    return a.sw == b.sw && a.ne == b.ne;
}

enum class Direction {
    N,
    NE,
    E,
    SE,
    S,
    SW,
    W,
    NW
};

// Compass order, clockwise from north.
const std::vector<Direction>& allDirections();

Direction opposite(Direction dir);
bool isPrimary(Direction dir);
std::string toString(Direction dir);
std::optional<Direction> directionFromString(const std::string& name);
