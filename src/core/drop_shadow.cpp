#include "drop_shadow.h"

#include "compositing.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace gearpix::core {

namespace {

std::vector<double> gaussian_kernel(int radius) {
    const double sigma = static_cast<double>(radius);
    const int half = static_cast<int>(std::ceil(3.0 * sigma));
    std::vector<double> kernel(static_cast<size_t>((2 * half) + 1));
    double total = 0.0;
    for (int i = -half; i <= half; ++i) {
        const double weight = std::exp(-(i * i) / (2.0 * sigma * sigma));
        kernel[static_cast<size_t>(i + half)] = weight;
        total += weight;
    }
    for (double& weight : kernel) {
        weight /= total;
    }
    return kernel;
}

// One 1D pass over alpha-weighted channels.
void blur_pass(const std::vector<double>& src, std::vector<double>& dst, int w, int h,
               const std::vector<double>& kernel, bool horizontal) {
    const int half = static_cast<int>(kernel.size() / 2);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            double acc[NUM_CHANNELS] = {0.0, 0.0, 0.0, 0.0};
            for (int k = -half; k <= half; ++k) {
                const int sx = horizontal ? std::clamp(x + k, 0, w - 1) : x;
                const int sy = horizontal ? y : std::clamp(y + k, 0, h - 1);
                const double weight = kernel[static_cast<size_t>(k + half)];
                const size_t offset = ((static_cast<size_t>(sy) * static_cast<size_t>(w)) + static_cast<size_t>(sx))
                                      * NUM_CHANNELS;
                for (size_t c = 0; c < NUM_CHANNELS; ++c) {
                    acc[c] += src[offset + c] * weight;
                }
            }
            const size_t out = ((static_cast<size_t>(y) * static_cast<size_t>(w)) + static_cast<size_t>(x))
                               * NUM_CHANNELS;
            for (size_t c = 0; c < NUM_CHANNELS; ++c) {
                dst[out + c] = acc[c];
            }
        }
    }
}

unsigned char to_channel(double value) {
    return static_cast<unsigned char>(std::clamp<long>(std::lround(value), 0, MAX_CHANNEL_VALUE));
}

} // namespace

bool validate_shadow_spec(const ShadowSpec& shadow, PipelineError& error) {
    if (shadow.blur_radius < 0 || shadow.blur_radius > MAX_SHADOW_BLUR_RADIUS) {
        return fail(error, ErrorCode::InvalidArgument,
                    "shadow blur radius " + std::to_string(shadow.blur_radius) + " is outside 0.."
                        + std::to_string(MAX_SHADOW_BLUR_RADIUS));
    }
    if (std::abs(static_cast<std::int64_t>(shadow.offset_x)) > MAX_SHADOW_OFFSET
        || std::abs(static_cast<std::int64_t>(shadow.offset_y)) > MAX_SHADOW_OFFSET) {
        return fail(error, ErrorCode::InvalidArgument,
                    "shadow offset " + std::to_string(shadow.offset_x) + "," + std::to_string(shadow.offset_y)
                        + " is outside +/-" + std::to_string(MAX_SHADOW_OFFSET));
    }
    return true;
}

void gaussian_blur(PixelBuffer& buffer, int radius) {
    if (radius <= 0 || buffer.empty()) {
        return;
    }
    radius = std::min(radius, MAX_SHADOW_BLUR_RADIUS);
    const int w = buffer.width();
    const int h = buffer.height();
    const std::vector<double> kernel = gaussian_kernel(radius);

    std::vector<double> channels(buffer.byte_size());
    unsigned char* rgba = buffer.data();
    for (size_t i = 0; i < channels.size(); i += NUM_CHANNELS) {
        const double alpha = rgba[i + CHANNEL_A];
        const double coverage = alpha / 255.0;
        channels[i + CHANNEL_R] = rgba[i + CHANNEL_R] * coverage;
        channels[i + CHANNEL_G] = rgba[i + CHANNEL_G] * coverage;
        channels[i + CHANNEL_B] = rgba[i + CHANNEL_B] * coverage;
        channels[i + CHANNEL_A] = alpha;
    }

    std::vector<double> temp(channels.size(), 0.0);
    blur_pass(channels, temp, w, h, kernel, true);
    blur_pass(temp, channels, w, h, kernel, false);

    for (size_t i = 0; i < channels.size(); i += NUM_CHANNELS) {
        const unsigned char alpha = to_channel(channels[i + CHANNEL_A]);
        rgba[i + CHANNEL_A] = alpha;
        if (alpha == 0) {
            rgba[i + CHANNEL_R] = 0;
            rgba[i + CHANNEL_G] = 0;
            rgba[i + CHANNEL_B] = 0;
            continue;
        }
        const double coverage = channels[i + CHANNEL_A] / 255.0;
        rgba[i + CHANNEL_R] = to_channel(channels[i + CHANNEL_R] / coverage);
        rgba[i + CHANNEL_G] = to_channel(channels[i + CHANNEL_G] / coverage);
        rgba[i + CHANNEL_B] = to_channel(channels[i + CHANNEL_B] / coverage);
    }
}

void apply_drop_shadow(PixelBuffer& buffer, const ShadowSpec& shadow) {
    const int width = buffer.width();
    const int height = buffer.height();
    PixelBuffer shadow_layer(width, height);

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const unsigned char alpha = buffer.at(x, y).a;
            if (alpha == 0) {
                continue;
            }
            const std::int64_t sx = static_cast<std::int64_t>(x) + shadow.offset_x;
            const std::int64_t sy = static_cast<std::int64_t>(y) + shadow.offset_y;
            if (sx < 0 || sy < 0 || sx >= width || sy >= height) {
                continue;
            }
            Color stamp = shadow.color;
            stamp.a = to_channel(shadow.color.a * (alpha / 255.0));
            const int px = static_cast<int>(sx);
            const int py = static_cast<int>(sy);
            shadow_layer.set(px, py, blend_over(shadow_layer.at(px, py), stamp));
        }
    }

    gaussian_blur(shadow_layer, shadow.blur_radius);

    draw_over(shadow_layer, buffer, 0, 0);
    buffer = std::move(shadow_layer);
}

} // namespace gearpix::core
