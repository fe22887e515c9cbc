#include "Neighbors.hpp"
#include "Base32Codec.hpp"

// Rows N, S, E, W; columns by geohash length parity (even, odd).
// Tables from github.com/davetroy/geohash-js.
static const char* const NEIGHBOUR[4][2] = {
    { "p0r21436x8zb9dcf5h7kjnmqesgutwvy", "bc01fg45238967deuvhjyznpkmstqrwx" },
    { "14365h7k9dcfesgujnmqp0r2twvyx8zb", "238967debc01fg45kmstqrwxuvhjyznp" },
    { "bc01fg45238967deuvhjyznpkmstqrwx", "p0r21436x8zb9dcf5h7kjnmqesgutwvy" },
    { "238967debc01fg45kmstqrwxuvhjyznp", "14365h7k9dcfesgujnmqp0r2twvyx8zb" }
};

static const char* const BORDER[4][2] = {
    { "prxz",     "bcfguvyz" },
    { "028b",     "0145hjnp" },
    { "bcfguvyz", "prxz"     },
    { "0145hjnp", "028b"     }
};

static int tableRow(Direction dir) {
    switch (dir) {
        case Direction::N: return 0;
        case Direction::S: return 1;
        case Direction::E: return 2;
        case Direction::W: return 3;
        default: return -1;
    }
}

static std::string adjacentPrimary(std::string hash, Direction dir) {
    int row = tableRow(dir);

    // Walk back from the last character while the step crosses the parent's border.
    size_t pos = hash.size();
    while (pos > 0) {
        pos--;
        int parity = static_cast<int>((pos + 1) % 2);
        char last = hash[pos];

        std::string neighbour = NEIGHBOUR[row][parity];
        std::string border = BORDER[row][parity];

        hash[pos] = encode5Bits(static_cast<int>(neighbour.find(last)));
        if (border.find(last) == std::string::npos) {
            break;
        }
    }
    return hash;
}

std::string adjacent(const std::string& geohash, Direction dir) {
    std::string hash = normalizeGeohash(geohash);

    switch (dir) {
        case Direction::NE: return adjacentPrimary(adjacentPrimary(hash, Direction::N), Direction::E);
        case Direction::SE: return adjacentPrimary(adjacentPrimary(hash, Direction::S), Direction::E);
        case Direction::SW: return adjacentPrimary(adjacentPrimary(hash, Direction::S), Direction::W);
        case Direction::NW: return adjacentPrimary(adjacentPrimary(hash, Direction::N), Direction::W);
        default: return adjacentPrimary(hash, dir);
    }
}

std::map<Direction, std::string> neighbours(const std::string& geohash) {
    std::string hash = normalizeGeohash(geohash);

    std::map<Direction, std::string> result;
    for (Direction dir : allDirections()) {
        result[dir] = adjacent(hash, dir);
    }
    return result;
}
