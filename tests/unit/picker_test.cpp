#include <gtest/gtest.h>
#include <cmath>

#include "scene/Camera.h"
#include "scene/GlobePicker.h"
#include "scene/ViewState.h"

class PickerTest : public ::testing::Test {
protected:
    Camera cam;

    void SetUp() override {
        // Default orthographic extents: +/-250 world units, camera at (0, 0, 400).
        cam.lookAt(glm::vec3(0.0f));
        cam.updateProjectionMatrix();
    }
};

TEST_F(PickerTest, CenterPixelHitsPointOfView) {
    ViewState pov;
    pov.latitude = 30.0;
    pov.longitude = 40.0;

    auto hit = PickGlobe(cam, GlobeRotation(pov), 100.0f, 400.0, 300.0, 800, 600);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->x, 30.0, 1e-2);
    EXPECT_NEAR(hit->y, 40.0, 1e-2);
}

TEST_F(PickerTest, OffCenterHitFollowsSphere) {
    // ndc x = 0.2 -> world x = 50 on a radius 100 globe facing (0, 0).
    auto hit = PickGlobe(cam, GlobeRotation(ViewState{}), 100.0f, 480.0, 300.0, 800, 600);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->x, 0.0, 1e-2);
    EXPECT_NEAR(hit->y, 30.0, 1e-2);
}

TEST_F(PickerTest, CornerMisses) {
    EXPECT_FALSE(PickGlobe(cam, glm::mat4(1.0f), 100.0f, 0.0, 0.0, 800, 600).has_value());
}

TEST_F(PickerTest, InvalidSurfaceMisses) {
    EXPECT_FALSE(PickGlobe(cam, glm::mat4(1.0f), 100.0f, 0.0, 0.0, 0, 600).has_value());
    EXPECT_FALSE(PickGlobe(cam, glm::mat4(1.0f), 0.0f, 400.0, 300.0, 800, 600).has_value());
}

TEST(Picker, PerspectiveCenterHit) {
    Camera cam;
    cam.projection = ProjectionType::Perspective;
    cam.aspect = 800.0f / 600.0f;
    cam.position = glm::vec3(0.0f, 0.0f, 300.0f);
    cam.lookAt(glm::vec3(0.0f));
    cam.updateProjectionMatrix();

    ViewState pov;
    pov.latitude = -20.0;
    pov.longitude = -100.0;
    auto hit = PickGlobe(cam, GlobeRotation(pov), 100.0f, 400.0, 300.0, 800, 600);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->x, -20.0, 1e-2);
    EXPECT_NEAR(hit->y, -100.0, 1e-2);
}
