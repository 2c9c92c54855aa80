/*
 * GlobeView.h
 *
 * Purpose:
 *   Declares the rendering-toolkit boundary consumed by the engine.
 *   The engine never touches OpenGL directly; GlobeRenderer implements this interface on top of GL
 *   and tests implement it with a plain in-memory fake.
 *
 * Readiness:
 *   - ready() is false until the globe's assets, material and camera exist.
 *   - camera() returns nullptr while not ready.
 */

#pragma once

#include <optional>

#include "scene/Camera.h"
#include "scene/ViewState.h"

class GlobeView {
public:
    virtual ~GlobeView() = default;

    virtual bool ready() const = 0;

    virtual Camera* camera() = 0;

    // Current point of view (during a transition: the interpolated pose).
    virtual ViewState pointOfView() const = 0;

    /*
     * Requests a new point of view.
     *
     * Parameters:
     *   pose         : Target orientation.
     *   transitionMs : 0 applies immediately (and cancels a running transition); > 0 animates.
     */
    virtual void pointOfView(const ViewState& pose, int transitionMs) = 0;

    // True while an animated pointOfView transition is in flight.
    virtual bool transitionActive() const = 0;

    // Replaces the marker layer; nullopt clears it.
    virtual void setMarker(const std::optional<Marker>& marker) = 0;

    // Resizes the drawing buffer (not the window).
    virtual void setBufferSize(int width, int height) = 0;
};
