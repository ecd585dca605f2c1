#pragma once

#include "pipeline_error.h"
#include "pixel_buffer.h"

namespace gearpix::core {

constexpr int DEFAULT_SHADOW_BLUR_RADIUS = 2;
constexpr Color DEFAULT_SHADOW_COLOR{.r = 0, .g = 0, .b = 0, .a = 116};
constexpr int MAX_SHADOW_BLUR_RADIUS = 128;
constexpr int MAX_SHADOW_OFFSET = 1024;

struct ShadowSpec {
    int offset_x = 0;
    int offset_y = 0;
    int blur_radius = DEFAULT_SHADOW_BLUR_RADIUS;
    Color color = DEFAULT_SHADOW_COLOR;
};

// Blur radius in [0, MAX_SHADOW_BLUR_RADIUS], offsets within
// +/-MAX_SHADOW_OFFSET; anything else is InvalidArgument.
bool validate_shadow_spec(const ShadowSpec& shadow, PipelineError& error);

// Separable Gaussian blur with sigma = radius, edges clamped. No-op for
// radius <= 0; radii above MAX_SHADOW_BLUR_RADIUS blur as the maximum.
void gaussian_blur(PixelBuffer& buffer, int radius);

// Puts a soft silhouette of buffer behind it, offset by the spec. The canvas
// does not grow; shadow falling outside it is lost.
void apply_drop_shadow(PixelBuffer& buffer, const ShadowSpec& shadow);

} // namespace gearpix::core
