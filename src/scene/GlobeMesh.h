/*
 * GlobeMesh.h
 *
 * Purpose:
 *   Generates a latitude/longitude (UV) sphere for the globe surface and for small marker spheres.
 *
 * Data layout:
 *   - vertices: interleaved [px, py, pz, nx, ny, nz, u, v] (8 floats per vertex), unit radius.
 *   - indices : uint32 triangle list.
 *   - Grid is (slices + 1) x (stacks + 1) vertices; the seam column is duplicated so u runs 0..1.
 *
 * Texture mapping (equirectangular):
 *   - u = (lng + 180) / 360, v = (lat + 90) / 180 (v = 0 at the south pole; images are loaded flipped).
 *   - Positions follow LatLngToUnit() so texture, picking and markers agree.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

struct GlobeGeometry {
    std::vector<float> vertices;
    std::vector<std::uint32_t> indices;

    std::size_t vertexCount() const { return vertices.size() / 8; }
};

/*
 * Builds a unit UV sphere.
 *
 * Parameters:
 *   slices : Segments around the equator (clamped to >= 3).
 *   stacks : Segments from pole to pole (clamped to >= 2).
 */
GlobeGeometry BuildGlobeGeometry(int slices, int stacks);
