#include "OverlayLayout.h"
#include "ExportSettings.h"
#include <algorithm>
#include <cmath>

namespace OverlayLayout {

OverlayRect compute(int canvasWidth, int canvasHeight, const OverlayPosition& position,
                    int sourceWidth, int sourceHeight) {
    using ExportSettingsUtil::evenDimension;

    const double aspect = (sourceWidth > 0 && sourceHeight > 0)
        ? static_cast<double>(sourceHeight) / sourceWidth
        : static_cast<double>(canvasHeight) / canvasWidth;

    const double scale = std::clamp(position.scale, 0.0, 1.0);
    int width = evenDimension(static_cast<int>(std::lround(canvasWidth * scale)));
    width = std::min(width, evenDimension(canvasWidth));
    int height = evenDimension(static_cast<int>(std::lround(width * aspect)));

    if (height > canvasHeight) {
        height = evenDimension(canvasHeight);
        width = std::min(evenDimension(static_cast<int>(std::lround(height / aspect))),
                         evenDimension(canvasWidth));
    }

    OverlayRect rect;
    rect.width = width;
    rect.height = height;

    const double left = position.x * canvasWidth - width / 2.0;
    const double top = position.y * canvasHeight - height / 2.0;
    rect.x = std::clamp(static_cast<int>(std::lround(left)), 0, canvasWidth - width);
    rect.y = std::clamp(static_cast<int>(std::lround(top)), 0, canvasHeight - height);
    return rect;
}

} // namespace OverlayLayout
