/*
 * GlobeMesh.cpp
 *
 * Purpose:
 *   Implements UV sphere generation (two triangles per grid cell, like a wrapped heightfield grid).
 */

#include "scene/GlobeMesh.h"
#include "scene/ViewState.h"

#include <algorithm>

GlobeGeometry BuildGlobeGeometry(int slices, int stacks) {
    slices = std::max(3, slices);
    stacks = std::max(2, stacks);

    GlobeGeometry g;
    g.vertices.reserve(static_cast<size_t>(slices + 1) * static_cast<size_t>(stacks + 1) * 8);
    g.indices.reserve(static_cast<size_t>(slices) * static_cast<size_t>(stacks) * 6);

    // Row 0 is the south pole, row `stacks` the north pole.
    for (int iy = 0; iy <= stacks; ++iy) {
        float v = static_cast<float>(iy) / static_cast<float>(stacks);
        double lat = -90.0 + 180.0 * v;

        for (int ix = 0; ix <= slices; ++ix) {
            float u = static_cast<float>(ix) / static_cast<float>(slices);
            double lng = -180.0 + 360.0 * u;

            glm::vec3 p = LatLngToUnit(lat, lng);

            // Unit sphere: normal == position.
            g.vertices.push_back(p.x); g.vertices.push_back(p.y); g.vertices.push_back(p.z);
            g.vertices.push_back(p.x); g.vertices.push_back(p.y); g.vertices.push_back(p.z);
            g.vertices.push_back(u);   g.vertices.push_back(v);
        }
    }

    const std::uint32_t row = static_cast<std::uint32_t>(slices + 1);
    for (int iy = 0; iy < stacks; ++iy) {
        for (int ix = 0; ix < slices; ++ix) {
            std::uint32_t i0 = static_cast<std::uint32_t>(iy) * row + static_cast<std::uint32_t>(ix);
            std::uint32_t i1 = i0 + 1;
            std::uint32_t i2 = i0 + row;
            std::uint32_t i3 = i2 + 1;

            // Counter-clockwise seen from outside.
            g.indices.push_back(i0); g.indices.push_back(i1); g.indices.push_back(i2);
            g.indices.push_back(i1); g.indices.push_back(i3); g.indices.push_back(i2);
        }
    }

    return g;
}
