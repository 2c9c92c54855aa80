/*
 * GlobeRenderer.cpp
 *
 * Purpose:
 *   Implements the OpenGL globe view: staged initialization, point-of-view handling, overlay
 *   layers and the draw pass.
 *
 * Render conventions:
 *   - The globe sits at the origin; the model matrix carries the point-of-view rotation and the
 *     radius scale. The camera stays on +Z; its up vector carries the seasonal tilt.
 *   - Overlays are built at world radius and drawn with the rotation only.
 */

#include "render/GlobeRenderer.h"
#include "core/Clock.h"
#include "scene/GlobeMesh.h"
#include "scene/GlobePicker.h"
#include "scene/OverlayGeometry.h"
#include "scene/TimeZoneArcs.h"

#include <glm/gtc/matrix_transform.hpp>
#include <chrono>
#include <iostream>
#include <utility>

namespace {

constexpr int kGlobeSlices = 128;
constexpr int kGlobeStacks = 64;

// Lift for the arc lines so they do not z-fight with the surface.
constexpr float kArcLift = 1.002f;

bool FutureReady(const std::future<std::optional<TextureUtils::DecodedImage>>& f) {
    return f.valid() && f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

GlobeRenderer::GlobeRenderer(const GlobeConfig& config, const Clock& clock, std::filesystem::path assetsRoot)
    : m_config(config), m_clock(clock), m_assetsRoot(std::move(assetsRoot)) {
    m_pov.latitude = 0.0;
    m_pov.longitude = 0.0;
    m_pov.altitude = config.initialAltitude;

    m_init.addStep("decode-textures", [this]() { return stepDecodeTextures(); });
    m_init.addStep("upload-textures", [this]() { return stepUploadTextures(); });
    m_init.addStep("build-material", [this]() { return stepBuildMaterial(); });
    m_init.addStep("build-globe-mesh", [this]() { return stepBuildGlobeMesh(); });
    m_init.addStep("build-camera", [this]() { return stepBuildCamera(); });
    m_init.addStep("build-overlays", [this]() { return stepBuildOverlays(); });
}

GlobeRenderer::~GlobeRenderer() {
    // Textures not yet adopted by the material.
    if (m_dayTex) glDeleteTextures(1, &m_dayTex);
    if (m_nightTex) glDeleteTextures(1, &m_nightTex);
}

std::string GlobeRenderer::assetPath(const std::string& relative) const {
    return (m_assetsRoot / relative).string();
}

StepStatus GlobeRenderer::advanceInit() {
    return m_init.advance();
}

// ---------------- init steps ----------------

StepStatus GlobeRenderer::stepDecodeTextures() {
    if (!m_dayFuture.valid() && !m_nightFuture.valid()) {
        TextureUtils::PrepareDecoder();
        std::string dayPath = assetPath(m_config.assets.dayTexture);
        std::string nightPath = assetPath(m_config.assets.nightTexture);
        m_dayFuture = std::async(std::launch::async, [dayPath]() { return TextureUtils::DecodeImageFile(dayPath); });
        m_nightFuture = std::async(std::launch::async, [nightPath]() { return TextureUtils::DecodeImageFile(nightPath); });
    }

    // Join point: both decodes must finish.
    if (!FutureReady(m_dayFuture) || !FutureReady(m_nightFuture)) return StepStatus::Pending;

    m_dayImage = m_dayFuture.get();
    m_nightImage = m_nightFuture.get();
    return StepStatus::Done;
}

StepStatus GlobeRenderer::stepUploadTextures() {
    if (m_dayImage) m_dayTex = TextureUtils::UploadTexture2D(*m_dayImage);
    if (m_nightImage) m_nightTex = TextureUtils::UploadTexture2D(*m_nightImage);
    m_dayImage.reset();
    m_nightImage.reset();

    if (!m_dayTex) {
        std::cerr << "[Globe] day texture failed, using fallback. path=" << assetPath(m_config.assets.dayTexture) << "\n";
        m_dayTex = TextureUtils::CreateSolidTexture2D(40, 80, 160); // ocean blue
    }
    if (!m_nightTex) {
        std::cerr << "[Globe] night texture failed, using fallback. path=" << assetPath(m_config.assets.nightTexture) << "\n";
        m_nightTex = TextureUtils::CreateSolidTexture2D(5, 5, 20);
    }
    return StepStatus::Done;
}

StepStatus GlobeRenderer::stepBuildMaterial() {
    TerminatorSoftness edges;
    edges.lo = m_config.shading.terminatorLo;
    edges.hi = m_config.shading.terminatorHi;

    bool ok = m_material.init(assetPath(m_config.assets.globeVert), assetPath(m_config.assets.globeFrag),
                              m_dayTex, m_nightTex, m_config.shading.lightDirectionView, edges);

    // Adopted by the material either way.
    m_dayTex = 0;
    m_nightTex = 0;
    return ok ? StepStatus::Done : StepStatus::Failed;
}

StepStatus GlobeRenderer::stepBuildGlobeMesh() {
    GlobeGeometry g = BuildGlobeGeometry(kGlobeSlices, kGlobeStacks);
    m_globeMesh.uploadInterleavedPosNormalUVIndexed(g.vertices, g.indices);
    return m_globeMesh.empty() ? StepStatus::Failed : StepStatus::Done;
}

StepStatus GlobeRenderer::stepBuildCamera() {
    const auto& vp = m_config.viewport;
    m_camera.projection = vp.projection;
    m_camera.fovDeg = vp.fovDeg;
    m_camera.nearPlane = vp.nearPlane;
    m_camera.farPlane = vp.farPlane;
    m_camera.position = glm::vec3(0.0f, 0.0f, vp.cameraDistance);
    m_camera.lookAt(glm::vec3(0.0f));
    m_camera.updateProjectionMatrix();
    return StepStatus::Done;
}

StepStatus GlobeRenderer::stepBuildOverlays() {
    if (!m_overlayShader.loadFromFiles(assetPath(m_config.assets.overlayVert), assetPath(m_config.assets.overlayFrag))) {
        return StepStatus::Failed;
    }

    if (m_config.overlay.showTimeZoneArcs) {
        std::vector<float> lines = BuildArcLineVertices(BuildTimeZoneArcs(), m_config.globeRadius * kArcLift,
                                                        glm::vec3(1.0f));
        m_arcMesh.uploadInterleavedPosColor(lines, GL_LINES);
    }

    m_markerDirty = true;
    return StepStatus::Done;
}

// ---------------- GlobeView ----------------

void GlobeRenderer::pointOfView(const ViewState& pose, int transitionMs) {
    ViewState target = pose;
    target.latitude = ClampLatitude(pose.latitude);
    target.longitude = NormalizeLongitude(pose.longitude);

    if (transitionMs <= 0) {
        m_animator.cancel();
        m_pov = target;
        if (ready()) applyViewToCamera();
        return;
    }

    m_animator.start(m_pov, target, m_clock.nowMs(), transitionMs);
}

void GlobeRenderer::setMarker(const std::optional<Marker>& marker) {
    m_marker = marker;
    m_markerDirty = true;
}

void GlobeRenderer::setBufferSize(int width, int height) {
    if (width <= 0 || height <= 0) return;
    glViewport(0, 0, width, height);
}

// ---------------- per frame ----------------

void GlobeRenderer::update() {
    if (m_animator.active()) m_pov = m_animator.sample(m_clock.nowMs());
    if (!ready()) return;

    if (m_markerDirty) rebuildMarkerMesh();
    applyViewToCamera();
}

void GlobeRenderer::rebuildMarkerMesh() {
    m_markerDirty = false;
    if (!m_marker) {
        m_markerMesh = Mesh();
        return;
    }

    float r = m_config.globeRadius * static_cast<float>(1.0 + m_config.marker.altitude);
    std::vector<float> fan = BuildMarkerFanVertices(m_marker->latitude, m_marker->longitude,
                                                    m_config.marker.radiusDeg, r, m_config.marker.color);
    m_markerMesh.uploadInterleavedPosColor(fan, GL_TRIANGLE_FAN);
}

/*
 * Maps altitude onto the camera.
 *
 * Orthographic: the camera distance does not change apparent size, so altitude drives zoom such
 * that the visible half-height equals half the equivalent perspective distance.
 * Perspective: the camera moves to radius * (1 + altitude) on +Z.
 */
void GlobeRenderer::applyViewToCamera() {
    float dist = m_config.globeRadius * static_cast<float>(1.0 + m_pov.altitude);

    if (m_camera.projection == ProjectionType::Orthographic) {
        if (m_camera.top > 0.0f && dist > 0.0f) m_camera.zoom = m_camera.top / (dist * 0.5f);
    } else {
        m_camera.position = glm::vec3(0.0f, 0.0f, dist);
        m_camera.lookAt(glm::vec3(0.0f));
    }
    m_camera.updateProjectionMatrix();
}

glm::mat4 GlobeRenderer::globeModel() const {
    return glm::scale(GlobeRotation(m_pov), glm::vec3(m_config.globeRadius));
}

void GlobeRenderer::render() const {
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    if (!ready()) return;

    m_material.bind(m_camera, globeModel());
    m_globeMesh.draw();

    if (m_arcMesh.empty() && m_markerMesh.empty()) return;

    m_overlayShader.use();
    m_overlayShader.setMat4("uModel", GlobeRotation(m_pov));
    m_overlayShader.setMat4("uView", m_camera.viewMatrix());
    m_overlayShader.setMat4("uProj", m_camera.projectionMatrix());
    m_overlayShader.setVec3("uTint", glm::vec3(1.0f));

    m_arcMesh.draw();
    m_markerMesh.draw();
}

void GlobeRenderer::hover(double cursorX, double cursorY, int windowW, int windowH) {
    if (!m_config.overlay.showTimeZoneArcs || !m_config.overlay.enablePointerInteraction) return;
    if (!ready()) return;

    std::string label;
    auto hit = PickGlobe(m_camera, GlobeRotation(m_pov), m_config.globeRadius, cursorX, cursorY, windowW, windowH);
    if (hit) label = TimeZoneMeridianNear(hit->y).value_or(std::string());

    if (label == m_hoverLabel) return;
    m_hoverLabel = label;
    if (!label.empty()) std::cerr << "[Globe] hovering meridian " << label << "\n";
}
