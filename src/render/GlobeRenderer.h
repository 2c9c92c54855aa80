/*
 * GlobeRenderer.h
 *
 * Purpose:
 *   OpenGL implementation of GlobeView. Owns the globe mesh, the day/night material, the overlay
 *   layers (time-zone arcs, location marker), the camera and the point-of-view state.
 *
 * Initialization (InitSequence, advanced once per frame by the caller):
 *   1) decode-textures  : both maps decode on std::async workers; Pending until both futures finish
 *   2) upload-textures  : GL upload, 1x1 fallback texture (logged) for a map that failed to decode
 *   3) build-material   : day/night shader program
 *   4) build-globe-mesh : UV sphere
 *   5) build-camera     : camera from GlobeConfig::viewport
 *   6) build-overlays   : overlay shader, arcs (if enabled), marker
 *   ready() is true only after the last step.
 *
 * Point of view:
 *   - pointOfView(pose, 0) applies immediately and cancels a running transition.
 *   - pointOfView(pose, ms > 0) starts a cubic in-out transition sampled by update().
 *   - Altitude maps to camera zoom (orthographic) or camera distance (perspective).
 *
 * Notes:
 *   - All GL calls happen on the thread that owns the context (the main thread).
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include <glad/glad.h>
#include <glm/glm.hpp>

#include "core/Config.h"
#include "engine/GlobeView.h"
#include "engine/InitSequence.h"
#include "render/DayNightMaterial.h"
#include "render/Mesh.h"
#include "render/Shader.h"
#include "render/TextureUtils.h"
#include "scene/Camera.h"
#include "scene/ViewState.h"

class Clock;

class GlobeRenderer : public GlobeView {
public:
    GlobeRenderer(const GlobeConfig& config, const Clock& clock, std::filesystem::path assetsRoot);
    ~GlobeRenderer() override;

    GlobeRenderer(const GlobeRenderer&) = delete;
    GlobeRenderer& operator=(const GlobeRenderer&) = delete;

    // Runs pending init steps. Requires a current GL context.
    StepStatus advanceInit();

    // Name of the init step still running (or the one that failed).
    std::string initStep() const { return m_init.currentStep(); }

    // GlobeView
    bool ready() const override { return m_init.ready(); }
    Camera* camera() override { return ready() ? &m_camera : nullptr; }
    ViewState pointOfView() const override { return m_pov; }
    void pointOfView(const ViewState& pose, int transitionMs) override;
    bool transitionActive() const override { return m_animator.active(); }
    void setMarker(const std::optional<Marker>& marker) override;
    void setBufferSize(int width, int height) override;

    // Samples the running transition and maps altitude onto the camera. Once per frame.
    void update();

    void render() const;

    /*
     * Cursor hover over the time-zone meridians.
     *
     * Parameters:
     *   cursorX, cursorY : Window coordinates (origin top-left).
     *   windowW, windowH : Window size in the same units as the cursor.
     *
     * Behavior:
     *   - Logs the meridian label when the hovered meridian changes. No-op unless both the arcs
     *     overlay and pointer interaction are enabled.
     */
    void hover(double cursorX, double cursorY, int windowW, int windowH);

private:
    GlobeConfig m_config;
    const Clock& m_clock;
    std::filesystem::path m_assetsRoot;

    InitSequence m_init;

    std::future<std::optional<TextureUtils::DecodedImage>> m_dayFuture;
    std::future<std::optional<TextureUtils::DecodedImage>> m_nightFuture;
    std::optional<TextureUtils::DecodedImage> m_dayImage;
    std::optional<TextureUtils::DecodedImage> m_nightImage;
    GLuint m_dayTex = 0;
    GLuint m_nightTex = 0;

    DayNightMaterial m_material;
    Mesh m_globeMesh;

    Shader m_overlayShader;
    Mesh m_arcMesh;
    Mesh m_markerMesh;
    std::optional<Marker> m_marker;
    bool m_markerDirty = false;

    Camera m_camera;

    ViewState m_pov;
    PointOfViewAnimator m_animator;

    std::string m_hoverLabel;

    std::string assetPath(const std::string& relative) const;

    StepStatus stepDecodeTextures();
    StepStatus stepUploadTextures();
    StepStatus stepBuildMaterial();
    StepStatus stepBuildGlobeMesh();
    StepStatus stepBuildCamera();
    StepStatus stepBuildOverlays();

    void rebuildMarkerMesh();
    void applyViewToCamera();
    glm::mat4 globeModel() const;
};
