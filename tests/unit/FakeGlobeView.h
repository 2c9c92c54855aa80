/*
 * FakeGlobeView.h
 *
 * Purpose:
 *   In-memory GlobeView for engine tests. Records every call and applies points of view immediately;
 *   a positive transition duration only flips the transitioning flag.
 */

#pragma once

#include <optional>

#include "engine/GlobeView.h"

class FakeGlobeView : public GlobeView {
public:
    bool isReady = true;
    Camera cam;
    ViewState pov;
    bool transitioning = false;

    int pointOfViewCalls = 0;
    int lastTransitionMs = -1;

    std::optional<Marker> markerState;
    int setMarkerCalls = 0;

    int bufferWidth = 0;
    int bufferHeight = 0;
    int setBufferSizeCalls = 0;

    bool ready() const override { return isReady; }
    Camera* camera() override { return isReady ? &cam : nullptr; }
    ViewState pointOfView() const override { return pov; }

    void pointOfView(const ViewState& pose, int transitionMs) override {
        pov = pose;
        pov.longitude = NormalizeLongitude(pose.longitude);
        ++pointOfViewCalls;
        lastTransitionMs = transitionMs;
        transitioning = transitionMs > 0;
    }

    bool transitionActive() const override { return transitioning; }

    void setMarker(const std::optional<Marker>& marker) override {
        markerState = marker;
        ++setMarkerCalls;
    }

    void setBufferSize(int width, int height) override {
        bufferWidth = width;
        bufferHeight = height;
        ++setBufferSizeCalls;
    }
};
