/*
 * ViewportAdapter.cpp
 *
 * Purpose:
 *   Implements resize handling for orthographic and perspective globe cameras.
 */

#include "engine/ViewportAdapter.h"
#include "engine/GlobeView.h"

#include <algorithm>

ViewportAdapter::ViewportAdapter(double marginFactor, float cameraDistance)
    : m_marginFactor(marginFactor > 0.0 ? marginFactor : 2.1), m_cameraDistance(cameraDistance) {}

OrthoExtents ViewportAdapter::ExtentsFor(int width, int height, double marginFactor) {
    double aspect = static_cast<double>(width) / static_cast<double>(height);
    double d = static_cast<double>(std::min(width, height)) / marginFactor;
    return OrthoExtents{
        static_cast<float>(-d * aspect),
        static_cast<float>(d * aspect),
        static_cast<float>(d),
        static_cast<float>(-d)
    };
}

// Zero sizes (minimized) and repeats of the applied size are dropped.
bool ViewportAdapter::onResize(GlobeView& view, int width, int height) {
    if (width <= 0 || height <= 0) return false;
    if (width == m_width && height == m_height && !m_pending) return false;

    m_width = width;
    m_height = height;
    m_pending = true;
    return apply(view);
}

/*
 * Applies a size remembered while the view was not ready.
 *
 * Returns:
 *   true once the camera and buffer picked up the size; false if nothing was pending or the view
 *   is still not ready (the size stays pending).
 */
bool ViewportAdapter::applyPending(GlobeView& view) {
    if (!m_pending) return false;
    return apply(view);
}

bool ViewportAdapter::apply(GlobeView& view) {
    if (!view.ready()) return false;
    Camera* cam = view.camera();
    if (!cam) return false;

    // Buffer only; the window itself is never resized from here.
    view.setBufferSize(m_width, m_height);

    if (cam->projection == ProjectionType::Orthographic) {
        OrthoExtents e = ExtentsFor(m_width, m_height, m_marginFactor);
        cam->left = e.left;
        cam->right = e.right;
        cam->top = e.top;
        cam->bottom = e.bottom;
        cam->position = glm::vec3(0.0f, 0.0f, m_cameraDistance);
        cam->lookAt(glm::vec3(0.0f));
    } else {
        cam->aspect = static_cast<float>(m_width) / static_cast<float>(m_height);
    }
    cam->updateProjectionMatrix();

    m_pending = false;
    return true;
}
