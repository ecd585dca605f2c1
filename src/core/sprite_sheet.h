#pragma once

#include <vector>

#include "pipeline_error.h"
#include "pixel_buffer.h"

namespace gearpix::core {

// Frames laid left to right in order, all sharing frame 0's size.
bool compose_sprite_sheet(const std::vector<PixelBuffer>& frames, PixelBuffer& out, PipelineError& error);

} // namespace gearpix::core
