/*
 * Location.h
 *
 * Purpose:
 *   Resolved location handed to the engine by the (external) geocoding side, plus the small parser
 *   for literal "lat,lng[,label]" input that needs no geocoding service.
 *
 * Validation:
 *   - latitude must lie in [-90, 90], longitude in [-180, 180] (normalized on output).
 *   - Invalid text is rejected here and reported to the caller; the engine only sees valid values.
 */

#pragma once

#include <optional>
#include <string>

struct Location {
    double latitude = 0.0;
    double longitude = 0.0;
    std::string label;
};

/*
 * Parses "lat,lng" or "lat,lng,label" (whitespace around fields is ignored).
 *
 * Returns:
 *   The location, or nullopt (with a logged reason) for malformed or out-of-range input.
 *   When no label is given, the label is the formatted coordinate pair.
 */
std::optional<Location> ParseLocation(const std::string& text);
