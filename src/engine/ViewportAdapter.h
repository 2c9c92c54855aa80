/*
 * ViewportAdapter.h
 *
 * Purpose:
 *   Keeps the camera projection consistent with the drawing surface's pixel size so the globe stays
 *   fully visible and centered for any aspect ratio.
 *
 * Model (orthographic):
 *   d = min(width, height) / marginFactor
 *   left = -d * aspect, right = d * aspect, top = d, bottom = -d
 *   camera reset to (0, 0, cameraDistance) looking at the origin
 *
 * Model (perspective):
 *   aspect = width / height
 *
 * Notes:
 *   - Runs on resize notifications only, never per frame.
 *   - Zero/negative sizes (minimized window) and unchanged sizes are ignored.
 *   - If the view is not ready yet, the size is remembered and applied by the next call to
 *     applyPending() once the camera exists.
 */

#pragma once

class GlobeView;

struct OrthoExtents {
    float left;
    float right;
    float top;
    float bottom;
};

class ViewportAdapter {
public:
    ViewportAdapter(double marginFactor, float cameraDistance);

    /*
     * Handles a surface size change.
     *
     * Returns:
     *   true if the projection and buffer size were updated.
     */
    bool onResize(GlobeView& view, int width, int height);

    // Re-applies a size that arrived while the view was not ready. Returns true if applied.
    bool applyPending(GlobeView& view);

    static OrthoExtents ExtentsFor(int width, int height, double marginFactor);

    int width() const { return m_width; }
    int height() const { return m_height; }
    bool hasPending() const { return m_pending; }

private:
    double m_marginFactor;
    float m_cameraDistance;

    int m_width = 0;
    int m_height = 0;
    bool m_pending = false;

    bool apply(GlobeView& view);
};
