#include "aspect_resize.h"

#include "compositing.h"

#include <cmath>
#include <string>
#include <utility>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize2.h>

namespace gearpix::core {

namespace {

std::string size_text(int width, int height) {
    return std::to_string(width) + "x" + std::to_string(height);
}

bool within_limits(double value) {
    return value <= static_cast<double>(MAX_IMAGE_DIMENSION);
}

} // namespace

bool resample_bicubic(const PixelBuffer& source, int width, int height, PixelBuffer& out, PipelineError& error) {
    if (width <= 0 || height <= 0 || width > MAX_IMAGE_DIMENSION || height > MAX_IMAGE_DIMENSION) {
        return fail(error, ErrorCode::InvalidDimension, "invalid resize target " + size_text(width, height));
    }
    if (source.empty()) {
        return fail(error, ErrorCode::InvalidDimension,
                    "cannot resize an empty image (" + size_text(source.width(), source.height()) + ")");
    }
    if (width == source.width() && height == source.height()) {
        out = source;
        return true;
    }

    // STBIR_RGBA weights color by alpha while filtering; edges are clamped.
    PixelBuffer result(width, height);
    const int source_stride = source.width() * static_cast<int>(NUM_CHANNELS);
    const int result_stride = width * static_cast<int>(NUM_CHANNELS);
    if (stbir_resize(source.data(), source.width(), source.height(), source_stride,
                     result.data(), width, height, result_stride,
                     STBIR_RGBA, STBIR_TYPE_UINT8, STBIR_EDGE_CLAMP, STBIR_FILTER_CATMULLROM) == nullptr) {
        return fail(error, ErrorCode::InvalidDimension,
                    "failed to resize " + size_text(source.width(), source.height()) + " to "
                        + size_text(width, height));
    }
    out = std::move(result);
    return true;
}

bool resize_with_aspect(const PixelBuffer& source, const ResizeSpec& spec, PixelBuffer& out, PipelineError& error) {
    if (source.empty()) {
        return fail(error, ErrorCode::InvalidDimension,
                    "cannot resize an empty image (" + size_text(source.width(), source.height()) + ")");
    }
    if (!std::isfinite(spec.target_size) || spec.target_size <= 0.0
        || !std::isfinite(spec.scale) || spec.scale < 0.0) {
        return fail(error, ErrorCode::InvalidDimension,
                    "invalid resize target " + std::to_string(spec.target_size)
                        + " at scale " + std::to_string(spec.scale));
    }

    double new_width = 0.0;
    double new_height = 0.0;
    if (source.width() >= source.height()) {
        new_width = spec.target_size;
        new_height = source.height() * (spec.target_size / source.width());
    } else {
        new_height = spec.target_size;
        new_width = source.width() * (spec.target_size / source.height());
    }
    new_width *= spec.scale;
    new_height *= spec.scale;

    const double canvas_side = spec.target_size * spec.scale;
    if (!within_limits(new_width) || !within_limits(new_height) || (spec.anchor && !within_limits(canvas_side))) {
        return fail(error, ErrorCode::InvalidDimension,
                    "resizing " + size_text(source.width(), source.height()) + " to "
                        + std::to_string(spec.target_size) + " at scale " + std::to_string(spec.scale)
                        + " exceeds " + std::to_string(MAX_IMAGE_DIMENSION) + " pixels");
    }

    // Half away from zero.
    const int width = static_cast<int>(std::lround(new_width));
    const int height = static_cast<int>(std::lround(new_height));
    if (width <= 0 || height <= 0) {
        return fail(error, ErrorCode::InvalidDimension,
                    "resizing " + size_text(source.width(), source.height()) + " to "
                        + std::to_string(spec.target_size) + " gives " + size_text(width, height));
    }

    PixelBuffer resized;
    if (!resample_bicubic(source, width, height, resized, error)) {
        return false;
    }
    if (!spec.anchor) {
        out = std::move(resized);
        return true;
    }

    const int canvas_size = static_cast<int>(std::lround(canvas_side));
    if (canvas_size <= 0) {
        return fail(error, ErrorCode::InvalidDimension,
                    "square canvas size " + std::to_string(canvas_size) + " is not positive");
    }
    const int pad_left = static_cast<int>(std::lround((canvas_size - resized.width()) * spec.anchor->x));
    const int pad_top = static_cast<int>(std::lround((canvas_size - resized.height()) * spec.anchor->y));

    PixelBuffer padded(canvas_size, canvas_size);
    draw_over(padded, resized, pad_left, pad_top);
    out = std::move(padded);
    return true;
}

} // namespace gearpix::core
