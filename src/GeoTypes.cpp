#include "GeoTypes.hpp"
#include <algorithm>
#include <cctype>

const std::vector<Direction>& allDirections() {
    static const std::vector<Direction> directions = {
        Direction::N, Direction::NE, Direction::E, Direction::SE,
        Direction::S, Direction::SW, Direction::W, Direction::NW
    };
    return directions;
}

Direction opposite(Direction dir) {
    switch (dir) {
        case Direction::N:  return Direction::S;
        case Direction::NE: return Direction::SW;
        case Direction::E:  return Direction::W;
        case Direction::SE: return Direction::NW;
        case Direction::S:  return Direction::N;
        case Direction::SW: return Direction::NE;
        case Direction::W:  return Direction::E;
        case Direction::NW: return Direction::SE;
    }
    return dir;
}

bool isPrimary(Direction dir) {
    return dir == Direction::N || dir == Direction::E || dir == Direction::S || dir == Direction::W;
}

std::string toString(Direction dir) {
    switch (dir) {
        case Direction::N:  return "n";
        case Direction::NE: return "ne";
        case Direction::E:  return "e";
        case Direction::SE: return "se";
        case Direction::S:  return "s";
        case Direction::SW: return "sw";
        case Direction::W:  return "w";
        case Direction::NW: return "nw";
    }
    return "";
}

std::optional<Direction> directionFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (Direction dir : allDirections()) {
        if (toString(dir) == lower) return dir;
    }
    return std::nullopt;
}
