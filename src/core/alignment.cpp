#include "alignment.h"

#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <ostream>

namespace gearpix::core {

namespace {

constexpr double SHADOW_WIDTH_NUDGE = 0.04;
constexpr double SHADOW_Y_OFFSET_FACTOR = 2.0;
constexpr double SHADOW_AESTHETIC_PADDING = 1.0;
constexpr Anchor ANCHOR_BOTTOM_LEFT{.x = 0.0, .y = 1.0};

std::string normalize_request(std::string_view request) {
    std::string normalized;
    normalized.reserve(request.size());
    for (char c : request) {
        if (c == '-' || c == '_') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return trim_copy(normalized);
}

double round_to(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

} // namespace

Anchor resolve_anchor(std::string_view request, std::ostream& warnings) {
    const std::string text = normalize_request(request);
    auto has = [&text](std::string_view word) {
        return text.find(word) != std::string::npos;
    };

    if (has("center") || has("middle")) {
        if (has("top")) {
            return Anchor{.x = 0.5, .y = 0.0};
        }
        if (has("left")) {
            return Anchor{.x = 0.0, .y = 0.5};
        }
        if (has("bottom")) {
            return Anchor{.x = 0.5, .y = 1.0};
        }
        if (has("right")) {
            return Anchor{.x = 1.0, .y = 0.5};
        }
        return ANCHOR_CENTER;
    }
    if (has("left")) {
        if (has("top")) {
            return Anchor{.x = 0.0, .y = 0.0};
        }
        if (has("bottom")) {
            return Anchor{.x = 0.0, .y = 1.0};
        }
        return Anchor{.x = 0.0, .y = 0.5};
    }
    if (has("right")) {
        if (has("top")) {
            return Anchor{.x = 1.0, .y = 0.0};
        }
        if (has("bottom")) {
            return Anchor{.x = 1.0, .y = 1.0};
        }
        return Anchor{.x = 1.0, .y = 0.5};
    }
    if (has("top")) {
        return Anchor{.x = 0.5, .y = 0.0};
    }
    if (has("bottom")) {
        return Anchor{.x = 0.5, .y = 1.0};
    }

    warnings << "Warning: Unrecognized alignment value '" << request << "'. Defaulting to (0, 0).\n";
    return Anchor{};
}

Anchor parse_alignment(const std::string& request, std::ostream& warnings) {
    const std::string trimmed = trim_copy(request);
    if (trimmed.empty()) {
        return Anchor{};
    }
    double x = 0.0;
    double y = 0.0;
    if (parse_double_pair(trimmed, x, y)) {
        if (x >= 0.0 && x <= 1.0 && y >= 0.0 && y <= 1.0) {
            return Anchor{.x = x, .y = y};
        }
        warnings << "Warning: Alignment " << trimmed << " is outside [0,1]. Defaulting to (0, 0).\n";
        return Anchor{};
    }
    return resolve_anchor(trimmed, warnings);
}

Offset suggest_offset(const PixelBuffer& image, const Anchor& anchor) {
    return Offset{
        .x = 0.5 * (anchor.x - 0.5) * (REFERENCE_TILE_SIZE - image.width()),
        .y = 0.5 * (anchor.y - 0.5) * (REFERENCE_TILE_SIZE - image.height()),
    };
}

Offset suggest_shadow_offset(const PixelBuffer& image, const Offset& image_offset, const PixelBuffer& shadow) {
    Offset offset = suggest_offset(shadow, ANCHOR_BOTTOM_LEFT);

    // Center the shadow under the image, then nudge for the engine's rendering.
    offset.x += round_to(((REFERENCE_TILE_SIZE / 2.0) - (image.width() / 2.0)) / 2.0, 3);
    offset.x += image.width() * SHADOW_WIDTH_NUDGE;

    // Engine sprites are center aligned, so half a shadow height moves it below.
    offset.y += shadow.height() / 2.0;

    offset.x += image_offset.x;
    offset.y += image_offset.y * SHADOW_Y_OFFSET_FACTOR;
    offset.y += SHADOW_AESTHETIC_PADDING;
    return offset;
}

void describe_alignment(const PixelBuffer& image, const PixelBuffer* shadow, const Anchor& anchor, std::ostream& log) {
    const auto flags = log.flags();
    const auto precision = log.precision();

    log << std::fixed << std::setprecision(1)
        << "Using alignment: (" << anchor.x << ", " << anchor.y << ")\n";
    const Offset offset = suggest_offset(image, anchor);
    log << std::setprecision(3)
        << "Suggested offset for image alignment: (" << offset.x << ", " << offset.y << ")\n";
    if (shadow != nullptr) {
        const Offset shadow_offset = suggest_shadow_offset(image, offset, *shadow);
        log << "Suggested offset for shadow alignment: (" << shadow_offset.x << ", " << shadow_offset.y << ")\n";
    }

    log.flags(flags);
    log.precision(precision);
}

} // namespace gearpix::core
