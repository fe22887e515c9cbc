#pragma once
#include <stdexcept>
#include <string>

enum class GeoErrorCode {
    InvalidCharacter,
    EmptyInput,
    InvalidPrecision,
    InvalidCoordinate
};

std::string toString(GeoErrorCode code);

class GeoHashError : public std::runtime_error {
public:
    GeoHashError(GeoErrorCode code, const std::string& message)
        : std::runtime_error(message), errorCode(code) {}

    GeoErrorCode code() const { return errorCode; }

private:
    GeoErrorCode errorCode;
};
