#include "alpha_trim.h"

#include <algorithm>
#include <string>

namespace gearpix::core {

namespace {

inline bool pixel_is_visible(const unsigned char* rgba, int width, int x, int y) {
    const size_t pixel_index = static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x);
    return rgba[(pixel_index * NUM_CHANNELS) + CHANNEL_A] != 0;
}

} // namespace

bool compute_trim_bounds(const PixelBuffer& buffer, Rect& out) {
    const int w = buffer.width();
    const int h = buffer.height();
    if (buffer.empty()) {
        return false;
    }
    const unsigned char* rgba = buffer.data();

    int min_y = 0;
    int top_hit_x = -1;
    for (int y = 0; y < h && top_hit_x < 0; ++y) {
        for (int x = 0; x < w; ++x) {
            if (pixel_is_visible(rgba, w, x, y)) {
                min_y = y;
                top_hit_x = x;
                break;
            }
        }
    }
    if (top_hit_x < 0) {
        return false;
    }

    int max_y = min_y;
    int bottom_hit_x = top_hit_x;
    for (int y = h - 1; y > min_y; --y) {
        bool found = false;
        for (int x = w - 1; x >= 0; --x) {
            if (pixel_is_visible(rgba, w, x, y)) {
                max_y = y;
                bottom_hit_x = x;
                found = true;
                break;
            }
        }
        if (found) {
            break;
        }
    }

    // The top and bottom hits bound the search for the side edges.
    const int left_search_end = std::min(top_hit_x, bottom_hit_x);
    int min_x = left_search_end;
    for (int x = 0; x < left_search_end; ++x) {
        bool found = false;
        for (int y = min_y; y <= max_y; ++y) {
            if (pixel_is_visible(rgba, w, x, y)) {
                found = true;
                break;
            }
        }
        if (found) {
            min_x = x;
            break;
        }
    }

    const int right_search_start = std::max(top_hit_x, bottom_hit_x);
    int max_x = right_search_start;
    for (int x = w - 1; x > right_search_start; --x) {
        bool found = false;
        for (int y = min_y; y <= max_y; ++y) {
            if (pixel_is_visible(rgba, w, x, y)) {
                found = true;
                break;
            }
        }
        if (found) {
            max_x = x;
            break;
        }
    }

    out = Rect{.x = min_x, .y = min_y, .w = max_x - min_x + 1, .h = max_y - min_y + 1};
    return true;
}

bool trim_transparent(PixelBuffer& buffer, PipelineError& error) {
    Rect bounds;
    if (!compute_trim_bounds(buffer, bounds)) {
        return fail(error, ErrorCode::EmptyImage,
                    "cannot process an image which is entirely transparent ("
                        + std::to_string(buffer.width()) + "x" + std::to_string(buffer.height()) + ")");
    }
    if (bounds.x == 0 && bounds.y == 0 && bounds.w == buffer.width() && bounds.h == buffer.height()) {
        return true;
    }
    buffer = buffer.crop(bounds);
    return true;
}

} // namespace gearpix::core
