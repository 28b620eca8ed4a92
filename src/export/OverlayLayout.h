#pragma once

#include "OverlayPosition.h"

struct OverlayRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

namespace OverlayLayout {

// Size and place an overlay on a canvas. Width is canvasWidth * scale,
// height follows the source aspect ratio (canvas aspect when unknown).
// The rect is shrunk to fit and clamped so it never leaves the canvas.
OverlayRect compute(int canvasWidth, int canvasHeight, const OverlayPosition& position,
                    int sourceWidth, int sourceHeight);

} // namespace OverlayLayout
