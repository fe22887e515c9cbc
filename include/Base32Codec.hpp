#pragma once
#include <string>

// Geohash alphabet: digits and lower-case letters without a, i, l, o.
extern const char* const BASE32_ALPHABET;

char encode5Bits(int index);
int decode5Bits(char symbol);

bool isValidGeohash(const std::string& geohash);
std::string normalizeGeohash(const std::string& geohash);
