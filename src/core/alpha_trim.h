#pragma once

#include "pipeline_error.h"
#include "pixel_buffer.h"

namespace gearpix::core {

// Smallest rectangle covering every pixel with alpha > 0.
// Returns false when the buffer is empty or fully transparent.
bool compute_trim_bounds(const PixelBuffer& buffer, Rect& out);

// Crops buffer in place to its trim bounds. Fails with EmptyImage and leaves
// the buffer untouched when there is nothing to keep.
bool trim_transparent(PixelBuffer& buffer, PipelineError& error);

} // namespace gearpix::core
