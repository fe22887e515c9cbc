#include "GeoHashError.hpp"

std::string toString(GeoErrorCode code) {
    switch (code) {
        case GeoErrorCode::InvalidCharacter: return "InvalidCharacter";
        case GeoErrorCode::EmptyInput: return "EmptyInput";
        case GeoErrorCode::InvalidPrecision: return "InvalidPrecision";
        case GeoErrorCode::InvalidCoordinate: return "InvalidCoordinate";
    }
    return "Unknown";
}
