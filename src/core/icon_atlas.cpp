#include "icon_atlas.h"

#include "alpha_trim.h"
#include "aspect_resize.h"
#include "compositing.h"

#include <algorithm>
#include <cstdlib>
#include <ostream>
#include <string>
#include <utility>

namespace gearpix::core {

bool compose_icon_atlas(const PixelBuffer& source,
                        const ShadowSpec& shadow,
                        PixelBuffer& out,
                        std::ostream& log,
                        PipelineError& error) {
    if (!validate_shadow_spec(shadow, error)) {
        return false;
    }
    PixelBuffer trimmed = source;
    if (!trim_transparent(trimmed, error)) {
        return false;
    }
    log << "Trimmed whitespace, cropped image to: " << trimmed.width() << "x" << trimmed.height() << "\n";

    const int difference = std::abs(trimmed.width() - trimmed.height());
    if (difference > ICON_SQUARE_TOLERANCE) {
        log << "Warning: The trimmed image is not square (difference: " << difference
            << "px). The icon may not appear as expected.\n";
    }

    PixelBuffer atlas(ICON_ATLAS_WIDTH, ICON_ATLAS_HEIGHT);
    const int blur_padding = std::max(0, shadow.blur_radius);
    for (size_t i = 0; i < ICON_RESOLUTIONS.size(); ++i) {
        const int resolution = ICON_RESOLUTIONS[i];
        const int pad = std::min(blur_padding, resolution / 4);

        // Each layer starts from the trimmed source, never from the previous layer.
        ResizeSpec spec;
        spec.target_size = resolution - (2 * pad);
        spec.anchor = ANCHOR_CENTER;
        PixelBuffer layer;
        if (!resize_with_aspect(trimmed, spec, layer, error)) {
            error.message = "icon layer " + std::to_string(resolution) + ": " + error.message;
            return false;
        }
        log << "Resized image to: " << layer.width() << "x" << layer.height() << " with padding " << pad << "\n";

        const int draw_x = ICON_POSITIONS[i] + pad;
        const int draw_y = pad;
        draw_over(atlas, layer, draw_x, draw_y);
        log << "Generated icon layer: " << resolution << "x" << resolution
            << " at position " << draw_x << "," << draw_y << "\n";
    }

    apply_drop_shadow(atlas, shadow);
    out = std::move(atlas);
    return true;
}

} // namespace gearpix::core
