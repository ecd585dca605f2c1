#pragma once

#include <array>
#include <iosfwd>

#include "drop_shadow.h"
#include "pipeline_error.h"
#include "pixel_buffer.h"

namespace gearpix::core {

constexpr int ICON_ATLAS_WIDTH = 120;
constexpr int ICON_ATLAS_HEIGHT = 64;
constexpr std::array<int, 4> ICON_RESOLUTIONS = {64, 32, 16, 8};
constexpr std::array<int, 4> ICON_POSITIONS = {0, 64, 96, 112};
// Trimmed sources further than this from square get a warning.
constexpr int ICON_SQUARE_TOLERANCE = 10;

// Trims source, draws it at every icon resolution into a 120x64 atlas and
// applies the drop shadow to the whole atlas.
bool compose_icon_atlas(const PixelBuffer& source,
                        const ShadowSpec& shadow,
                        PixelBuffer& out,
                        std::ostream& log,
                        PipelineError& error);

} // namespace gearpix::core
