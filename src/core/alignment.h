#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "pixel_buffer.h"

namespace gearpix::core {

// Reference tile edge of the target engine, in pixels.
constexpr int REFERENCE_TILE_SIZE = 64;

struct Offset {
    double x = 0.0;
    double y = 0.0;
};

// Resolves semantic alignment words ("top-left", "Center_Bottom", ...).
// Unrecognized text resolves to (0, 0) and a warning is written.
Anchor resolve_anchor(std::string_view request, std::ostream& warnings);

// Accepts a normalized "x,y" pair in [0,1] or semantic words.
Anchor parse_alignment(const std::string& request, std::ostream& warnings);

Offset suggest_offset(const PixelBuffer& image, const Anchor& anchor);

// Offset that places shadow directly under image, which itself is placed at
// image_offset. The tuning constants are matched against the engine output.
Offset suggest_shadow_offset(const PixelBuffer& image, const Offset& image_offset, const PixelBuffer& shadow);

// Prints the anchor and suggested offsets; shadow may be null.
void describe_alignment(const PixelBuffer& image, const PixelBuffer* shadow, const Anchor& anchor, std::ostream& log);

} // namespace gearpix::core
