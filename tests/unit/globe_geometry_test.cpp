#include <gtest/gtest.h>
#include <cmath>

#include "scene/GlobeMesh.h"
#include "scene/OverlayGeometry.h"

static float LengthAt(const std::vector<float>& v, std::size_t vertex, std::size_t stride) {
    std::size_t o = vertex * stride;
    return std::sqrt(v[o] * v[o] + v[o + 1] * v[o + 1] + v[o + 2] * v[o + 2]);
}

TEST(GlobeGeometry, GridCounts) {
    GlobeGeometry g = BuildGlobeGeometry(4, 2);
    EXPECT_EQ(g.vertexCount(), 15u);
    EXPECT_EQ(g.indices.size(), 48u);

    for (std::uint32_t i : g.indices) EXPECT_LT(i, g.vertexCount());
}

TEST(GlobeGeometry, DegenerateSizesAreClamped) {
    GlobeGeometry g = BuildGlobeGeometry(1, 1);
    EXPECT_EQ(g.vertexCount(), 4u * 3u);
}

TEST(GlobeGeometry, UnitRadiusAndEquirectangularUVs) {
    GlobeGeometry g = BuildGlobeGeometry(4, 2);
    for (std::size_t i = 0; i < g.vertexCount(); ++i) {
        EXPECT_NEAR(LengthAt(g.vertices, i, 8), 1.0f, 1e-5f);
    }

    // Vertex 0: south pole, u = v = 0.
    EXPECT_NEAR(g.vertices[1], -1.0f, 1e-6f);
    EXPECT_FLOAT_EQ(g.vertices[6], 0.0f);
    EXPECT_FLOAT_EQ(g.vertices[7], 0.0f);

    // Row 1, column 2: (lat 0, lng 0) faces +Z at u = v = 0.5.
    const float* v = &g.vertices[7 * 8];
    EXPECT_NEAR(v[0], 0.0f, 1e-6f);
    EXPECT_NEAR(v[1], 0.0f, 1e-6f);
    EXPECT_NEAR(v[2], 1.0f, 1e-6f);
    EXPECT_FLOAT_EQ(v[6], 0.5f);
    EXPECT_FLOAT_EQ(v[7], 0.5f);
}

TEST(OverlayGeometry, ArcLinesTwoVerticesPerSegment) {
    std::vector<ArcSegment> arcs{
        ArcSegment{90.0, 0.0, 88.0, 0.0, "UTC"},
        ArcSegment{10.0, 45.0, 8.0, 45.0, "UTC+3"},
    };
    auto v = BuildArcLineVertices(arcs, 100.2f, glm::vec3(1.0f, 0.5f, 0.25f));
    ASSERT_EQ(v.size(), 2u * 2u * 6u);

    for (std::size_t i = 0; i < 4; ++i) EXPECT_NEAR(LengthAt(v, i, 6), 100.2f, 1e-3f);
    EXPECT_NEAR(v[1], 100.2f, 1e-3f); // north pole
    EXPECT_FLOAT_EQ(v[4], 0.5f);
}

TEST(OverlayGeometry, MarkerFanIsClosedDiscOnSphere) {
    const int segments = 24;
    auto v = BuildMarkerFanVertices(10.0, 20.0, 1.0, 102.0f, glm::vec3(1.0f, 1.0f, 0.0f), segments);
    ASSERT_EQ(v.size(), static_cast<std::size_t>(segments + 2) * 6u);

    glm::vec3 center(v[0], v[1], v[2]);
    EXPECT_NEAR(glm::length(center), 102.0f, 1e-3f);

    for (int i = 1; i < segments + 2; ++i) {
        glm::vec3 p(v[i * 6], v[i * 6 + 1], v[i * 6 + 2]);
        EXPECT_NEAR(glm::length(p), 102.0f, 1e-3f);
        float angle = std::acos(glm::clamp(glm::dot(glm::normalize(p), glm::normalize(center)), -1.0f, 1.0f));
        EXPECT_NEAR(glm::degrees(angle), 1.0f, 1e-2f);
    }

    // First rim vertex repeated at the end.
    std::size_t first = 6, last = static_cast<std::size_t>(segments + 1) * 6;
    EXPECT_NEAR(v[first], v[last], 1e-4f);
    EXPECT_NEAR(v[first + 1], v[last + 1], 1e-4f);
    EXPECT_NEAR(v[first + 2], v[last + 2], 1e-4f);
}

TEST(OverlayGeometry, MarkerAtPoleStaysFinite) {
    auto v = BuildMarkerFanVertices(90.0, 0.0, 2.0, 100.0f, glm::vec3(1.0f), 8);
    ASSERT_EQ(v.size(), 10u * 6u);
    for (float f : v) EXPECT_TRUE(std::isfinite(f));
    EXPECT_NEAR(v[1], 100.0f, 1e-3f);
}
