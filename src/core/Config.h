/*
 * Config.h
 *
 * Purpose:
 *   Declares GlobeConfig, the single tuning block for the globe engine and renderer.
 *   The variants of the globe (time-zone overlay on/off, pointer picking on/off, orthographic vs
 *   perspective camera) are expressed here instead of in separate setup code paths.
 *
 * Usage:
 *   - Construct with defaults, edit fields, pass by const reference to GlobeRenderer and GlobeEngine.
 *   - Values are read at construction/initialization time; editing afterwards has no effect.
 */

#pragma once

#include <cstdint>
#include <string>
#include <glm/glm.hpp>

#include "scene/Camera.h"

struct GlobeConfig {
    struct Rotation {
        // Auto-rotation rate in degrees per millisecond.
        // Default is one revolution per day (360 / 86,400,000). Negative values reverse the direction.
        double degreesPerMs = 360.0 / 86400000.0;
    } rotation;

    struct Interaction {
        // Quiet period after the last interaction end before auto-rotation resumes.
        std::int64_t debounceMs = 2000;
    } interaction;

    struct Shading {
        // Light direction in view space (camera-relative). Sun from the right by default.
        glm::vec3 lightDirectionView{1.0f, 0.0f, 0.0f};

        // Smoothstep edges on N·L. A narrow band gives a crisp but anti-aliased terminator.
        float terminatorLo = 0.0f;
        float terminatorHi = 0.15f;
    } shading;

    struct Viewport {
        // Half-extent divisor: d = min(width, height) / marginFactor.
        double marginFactor = 2.1;

        // Orthographic camera distance from the globe center (world units).
        float cameraDistance = 400.0f;
        float nearPlane = 0.1f;
        float farPlane = 2000.0f;

        ProjectionType projection = ProjectionType::Orthographic;
        float fovDeg = 50.0f; // perspective only
    } viewport;

    struct Controls {
        bool enableZoom = true;
        bool enablePan = false;
        bool enableRotate = true;

        // Drag sensitivity at altitude 1.0 (scaled with altitude so far views move faster).
        double rotateDegreesPerPixel = 0.25;

        // Relative altitude change per scroll tick.
        double zoomStep = 0.1;
        double minAltitude = 0.1;
        double maxAltitude = 10.0;
    } controls;

    struct Overlay {
        bool showTimeZoneArcs = true;

        // Cursor picking against the globe (hover labels for the time-zone meridians).
        bool enablePointerInteraction = true;
    } overlay;

    struct MarkerStyle {
        double radiusDeg = 0.6;   // angular radius on the surface
        double altitude = 0.02;   // lift above the surface in globe radii
        glm::vec3 color{1.0f, 1.0f, 0.0f};
    } marker;

    struct Recenter {
        int transitionMs = 1000;
        double altitude = 2.0;
    } recenter;

    struct Assets {
        // Paths relative to the assets root.
        std::string dayTexture = "textures/earth-day.jpg";
        std::string nightTexture = "textures/earth-night.jpg";
        std::string globeVert = "shaders/globe.vert";
        std::string globeFrag = "shaders/globe.frag";
        std::string overlayVert = "shaders/overlay.vert";
        std::string overlayFrag = "shaders/overlay.frag";
    } assets;

    // Globe radius in world units (globe.gl convention).
    float globeRadius = 100.0f;

    // Initial orientation before any recenter.
    double initialAltitude = 2.5;
};
