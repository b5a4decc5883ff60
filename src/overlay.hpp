#pragma once

#include "renderer.hpp"
#include "view.hpp"

#include <cstdint>

void draw_horizontal_line(PixelBuffer& buf, uint32_t y, RGBAColor color);
void draw_vertical_line(PixelBuffer& buf, uint32_t x, RGBAColor color);

// Full-image crosshair through the given pixel. An axis that falls outside
// the image draws nothing, so a point beyond the left edge still shows its
// horizontal line.
void draw_constrained_crosshair(PixelBuffer& buf, const PixelCoords& at,
                                RGBAColor color = CROSSHAIR_COLOR);
