#include "Base32Codec.hpp"
#include "GeoHashError.hpp"
#include <cctype>
#include <cstring>
#include <stdexcept>

const char* const BASE32_ALPHABET = "0123456789bcdefghjkmnpqrstuvwxyz";

char encode5Bits(int index) {
    if (index < 0 || index > 31) {
        throw std::out_of_range("base32 index must be in 0..31, got " + std::to_string(index));
    }
    return BASE32_ALPHABET[index];
}

int decode5Bits(char symbol) {
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(symbol)));
    const char* pos = lower != '\0' ? std::strchr(BASE32_ALPHABET, lower) : nullptr;
    if (pos == nullptr) {
        throw GeoHashError(GeoErrorCode::InvalidCharacter,
                           std::string("invalid geohash character '") + symbol + "'");
    }
    return static_cast<int>(pos - BASE32_ALPHABET);
}

bool isValidGeohash(const std::string& geohash) {
    if (geohash.empty()) return false;
    for (char c : geohash) {
        char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower == '\0' || std::strchr(BASE32_ALPHABET, lower) == nullptr) return false;
    }
    return true;
}

std::string normalizeGeohash(const std::string& geohash) {
    if (geohash.empty()) {
        throw GeoHashError(GeoErrorCode::EmptyInput, "empty geohash");
    }
    std::string result;
    result.reserve(geohash.size());
    for (char c : geohash) {
        result += BASE32_ALPHABET[decode5Bits(c)];
    }
    return result;
}
