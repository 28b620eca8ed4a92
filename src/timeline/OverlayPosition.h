#pragma once

#include "AppConstants.h"

// Overlay placement on the canvas. x/y locate the overlay centre as fractions
// of canvas width/height; scale is the fraction of canvas width it occupies.
struct OverlayPosition {
    double x = AppConstants::DefaultOverlayX;
    double y = AppConstants::DefaultOverlayY;
    double scale = AppConstants::DefaultOverlayScale;

    bool isDefault() const {
        return x == AppConstants::DefaultOverlayX &&
               y == AppConstants::DefaultOverlayY &&
               scale == AppConstants::DefaultOverlayScale;
    }
};
