#pragma once
#include <map>
#include <string>
#include "GeoTypes.hpp"

// Same precision; wraps at the antimeridian and at the poles.
std::string adjacent(const std::string& geohash, Direction dir);

// All eight surrounding cells.
std::map<Direction, std::string> neighbours(const std::string& geohash);
