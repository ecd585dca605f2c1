#pragma once

#include <optional>

#include "pipeline_error.h"
#include "pixel_buffer.h"

namespace gearpix::core {

struct ResizeSpec {
    double target_size = 0.0;          // length of the long axis before scaling
    double scale = 1.0;
    std::optional<Anchor> anchor;       // pad to a square canvas when set
};

// Catmull-Rom (bicubic) resample to exactly width x height, alpha weighted,
// edges clamped. Sizes above MAX_IMAGE_DIMENSION are rejected.
bool resample_bicubic(const PixelBuffer& source, int width, int height, PixelBuffer& out, PipelineError& error);

// Fits the long axis (width on ties) to spec.target_size, multiplies both
// axes by spec.scale and rounds half away from zero. With an anchor the result
// is placed on a transparent square of side round(target_size * scale).
// Any side above MAX_IMAGE_DIMENSION fails with InvalidDimension.
bool resize_with_aspect(const PixelBuffer& source, const ResizeSpec& spec, PixelBuffer& out, PipelineError& error);

} // namespace gearpix::core
