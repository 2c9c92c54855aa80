/*
 * Location.cpp
 *
 * Purpose:
 *   Implements literal coordinate parsing for location input.
 */

#include "core/Location.h"
#include "scene/ViewState.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>

static std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Parses a whole field as a finite double.
static std::optional<double> ParseNumber(const std::string& field) {
    std::string f = Trim(field);
    if (f.empty()) return std::nullopt;

    char* end = nullptr;
    double v = std::strtod(f.c_str(), &end);
    if (end != f.c_str() + f.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<Location> ParseLocation(const std::string& text) {
    auto c1 = text.find(',');
    if (c1 == std::string::npos) {
        std::cerr << "[Location] expected \"lat,lng\": " << text << "\n";
        return std::nullopt;
    }
    auto c2 = text.find(',', c1 + 1);

    auto lat = ParseNumber(text.substr(0, c1));
    auto lng = ParseNumber(text.substr(c1 + 1, c2 == std::string::npos ? std::string::npos : c2 - c1 - 1));
    if (!lat || !lng) {
        std::cerr << "[Location] not a coordinate pair: " << text << "\n";
        return std::nullopt;
    }
    if (*lat < -90.0 || *lat > 90.0 || *lng < -180.0 || *lng > 180.0) {
        std::cerr << "[Location] coordinates out of range: " << text << "\n";
        return std::nullopt;
    }

    Location loc;
    loc.latitude = *lat;
    loc.longitude = NormalizeLongitude(*lng);
    if (c2 != std::string::npos) loc.label = Trim(text.substr(c2 + 1));

    if (loc.label.empty()) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.4f, %.4f", loc.latitude, loc.longitude);
        loc.label = buf;
    }
    return loc;
}
