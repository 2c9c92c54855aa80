#include <gtest/gtest.h>
#include <vector>

#include "core/Controls.h"

class ControlsTest : public ::testing::Test {
protected:
    Controls controls;
    int starts = 0;
    int ends = 0;
    std::vector<ViewDelta> changes;

    void SetUp() override {
        controls.addStartListener([this] { ++starts; });
        controls.addEndListener([this] { ++ends; });
        controls.addChangeListener([this](const ViewDelta& d) { changes.push_back(d); });
    }
};

TEST_F(ControlsTest, DragEmitsStartChangeEnd) {
    controls.pointerDown(PointerButton::Primary, 100, 100);
    EXPECT_EQ(starts, 1);
    EXPECT_TRUE(controls.dragging());

    controls.pointerMove(110, 96);
    ASSERT_EQ(changes.size(), 1u);
    // Dragging right moves the view west; dragging up moves it south.
    EXPECT_DOUBLE_EQ(changes[0].dLongitude, -10 * 0.25);
    EXPECT_DOUBLE_EQ(changes[0].dLatitude, -4 * 0.25);
    EXPECT_DOUBLE_EQ(changes[0].altitudeScale, 1.0);

    controls.pointerUp(PointerButton::Primary);
    EXPECT_EQ(ends, 1);
    EXPECT_FALSE(controls.dragging());
}

TEST_F(ControlsTest, MoveWithoutDragIsIgnored) {
    controls.pointerMove(10, 10);
    controls.pointerMove(50, 50);
    EXPECT_TRUE(changes.empty());
}

TEST_F(ControlsTest, SensitivityScalesWithAltitude) {
    controls.altitudeHint = 2.0;
    controls.pointerDown(PointerButton::Primary, 0, 0);
    controls.pointerMove(4, 0);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_DOUBLE_EQ(changes[0].dLongitude, -4 * 0.25 * 2.0);
}

TEST_F(ControlsTest, WheelIsAStartChangeEndBurst) {
    controls.wheel(1.0);
    EXPECT_EQ(starts, 1);
    EXPECT_EQ(ends, 1);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_LT(changes[0].altitudeScale, 1.0);

    controls.wheel(-1.0);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_GT(changes[1].altitudeScale, 1.0);
}

TEST_F(ControlsTest, DisabledGesturesEmitNothing) {
    controls.enableRotate = false;
    controls.enableZoom = false;

    controls.pointerDown(PointerButton::Primary, 0, 0);
    controls.pointerMove(20, 20);
    controls.pointerUp(PointerButton::Primary);
    controls.wheel(3.0);

    EXPECT_EQ(starts, 0);
    EXPECT_EQ(ends, 0);
    EXPECT_TRUE(changes.empty());
}

TEST_F(ControlsTest, PanIsOffByDefaultAndHalfRateWhenEnabled) {
    controls.pointerDown(PointerButton::Secondary, 0, 0);
    EXPECT_EQ(starts, 0);

    controls.enablePan = true;
    controls.pointerDown(PointerButton::Secondary, 0, 0);
    controls.pointerMove(8, 0);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_DOUBLE_EQ(changes[0].dLongitude, -8 * 0.25 * 0.5);
}

TEST_F(ControlsTest, MultiButtonDragIsOneGesture) {
    controls.enablePan = true;
    controls.pointerDown(PointerButton::Primary, 0, 0);
    controls.pointerDown(PointerButton::Secondary, 0, 0);
    EXPECT_EQ(starts, 1);

    controls.pointerUp(PointerButton::Secondary);
    EXPECT_TRUE(controls.dragging());
    EXPECT_EQ(ends, 0);

    controls.pointerUp(PointerButton::Primary);
    EXPECT_EQ(ends, 1);

    // Releasing a button that is not down does nothing.
    controls.pointerUp(PointerButton::Primary);
    EXPECT_EQ(ends, 1);
}

TEST_F(ControlsTest, WheelDuringDragOnlyEmitsChange) {
    controls.pointerDown(PointerButton::Primary, 0, 0);
    controls.wheel(1.0);
    controls.wheel(-2.0);

    EXPECT_EQ(starts, 1);
    EXPECT_EQ(ends, 0);
    EXPECT_EQ(changes.size(), 2u);

    controls.pointerUp(PointerButton::Primary);
    EXPECT_EQ(ends, 1);

    // After the drag, the wheel is a gesture of its own again.
    controls.wheel(1.0);
    EXPECT_EQ(starts, 2);
    EXPECT_EQ(ends, 2);
}

TEST(ControlsListenerTest, RemovedListenersStopReceiving) {
    Controls controls;
    int calls = 0;
    ListenerId id = controls.addStartListener([&] { ++calls; });
    EXPECT_EQ(controls.listenerCount(), 1u);

    controls.wheel(1.0);
    EXPECT_TRUE(controls.removeListener(id));
    EXPECT_FALSE(controls.removeListener(id));
    controls.wheel(1.0);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(controls.listenerCount(), 0u);
}

TEST(ControlsListenerTest, ListenerMayRemoveItselfDuringDispatch) {
    Controls controls;
    int calls = 0;
    ListenerId id = 0;
    id = controls.addEndListener([&] {
        ++calls;
        controls.removeListener(id);
    });

    controls.wheel(1.0);
    controls.wheel(1.0);
    EXPECT_EQ(calls, 1);
}
