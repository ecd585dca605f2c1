#pragma once

#include "pixel_buffer.h"

namespace gearpix::core {

// Straight-alpha "over": src on top of dst.
[[nodiscard]] Color blend_over(const Color& dst, const Color& src);

// Composites src over dst with its top-left corner at (x, y); clipped.
void draw_over(PixelBuffer& dst, const PixelBuffer& src, int x, int y);

} // namespace gearpix::core
