#include "pixel_buffer.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace gearpix::core {

namespace {

size_t checked_byte_count(int width, int height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("negative pixel buffer size: "
                                    + std::to_string(width) + "x" + std::to_string(height));
    }
    return static_cast<size_t>(width) * static_cast<size_t>(height) * NUM_CHANNELS;
}

} // namespace

PixelBuffer::PixelBuffer(int width, int height)
    : width_(width), height_(height), rgba_(checked_byte_count(width, height), 0) {}

PixelBuffer::PixelBuffer(int width, int height, std::vector<unsigned char> rgba)
    : width_(width), height_(height), rgba_(std::move(rgba)) {
    if (rgba_.size() != checked_byte_count(width, height)) {
        throw std::invalid_argument("pixel data does not match "
                                    + std::to_string(width) + "x" + std::to_string(height));
    }
}

size_t PixelBuffer::offset_of(int x, int y) const {
    if (!contains(x, y)) {
        throw std::out_of_range("pixel (" + std::to_string(x) + "," + std::to_string(y)
                                + ") outside " + std::to_string(width_) + "x" + std::to_string(height_));
    }
    const size_t pixel_index = (static_cast<size_t>(y) * static_cast<size_t>(width_)) + static_cast<size_t>(x);
    return pixel_index * NUM_CHANNELS;
}

Color PixelBuffer::at(int x, int y) const {
    const size_t offset = offset_of(x, y);
    return Color{
        .r = rgba_[offset + CHANNEL_R],
        .g = rgba_[offset + CHANNEL_G],
        .b = rgba_[offset + CHANNEL_B],
        .a = rgba_[offset + CHANNEL_A],
    };
}

void PixelBuffer::set(int x, int y, const Color& color) {
    const size_t offset = offset_of(x, y);
    rgba_[offset + CHANNEL_R] = color.r;
    rgba_[offset + CHANNEL_G] = color.g;
    rgba_[offset + CHANNEL_B] = color.b;
    rgba_[offset + CHANNEL_A] = color.a;
}

void PixelBuffer::fill(const Color& color) {
    for (size_t offset = 0; offset < rgba_.size(); offset += NUM_CHANNELS) {
        rgba_[offset + CHANNEL_R] = color.r;
        rgba_[offset + CHANNEL_G] = color.g;
        rgba_[offset + CHANNEL_B] = color.b;
        rgba_[offset + CHANNEL_A] = color.a;
    }
}

PixelBuffer PixelBuffer::crop(const Rect& rect) const {
    if (rect.w < 0 || rect.h < 0 || rect.x < 0 || rect.y < 0
        || rect.x > width_ - rect.w || rect.y > height_ - rect.h) {
        throw std::out_of_range("crop rectangle outside " + std::to_string(width_) + "x" + std::to_string(height_));
    }
    PixelBuffer out(rect.w, rect.h);
    const size_t row_bytes = static_cast<size_t>(rect.w) * NUM_CHANNELS;
    for (int row = 0; row < rect.h; ++row) {
        const size_t src_offset = ((static_cast<size_t>(rect.y + row) * static_cast<size_t>(width_))
                                   + static_cast<size_t>(rect.x)) * NUM_CHANNELS;
        const size_t dst_offset = static_cast<size_t>(row) * row_bytes;
        std::memcpy(out.rgba_.data() + dst_offset, rgba_.data() + src_offset, row_bytes);
    }
    return out;
}

void PixelBuffer::blit(const PixelBuffer& src, int x, int y) {
    const int left = std::max(0, x);
    const int top = std::max(0, y);
    const int right = std::min(width_, x + src.width_);
    const int bottom = std::min(height_, y + src.height_);
    if (left >= right || top >= bottom) {
        return;
    }
    const size_t row_bytes = static_cast<size_t>(right - left) * NUM_CHANNELS;
    for (int dy = top; dy < bottom; ++dy) {
        const size_t src_offset = ((static_cast<size_t>(dy - y) * static_cast<size_t>(src.width_))
                                   + static_cast<size_t>(left - x)) * NUM_CHANNELS;
        const size_t dst_offset = ((static_cast<size_t>(dy) * static_cast<size_t>(width_))
                                   + static_cast<size_t>(left)) * NUM_CHANNELS;
        std::memcpy(rgba_.data() + dst_offset, src.rgba_.data() + src_offset, row_bytes);
    }
}

} // namespace gearpix::core
