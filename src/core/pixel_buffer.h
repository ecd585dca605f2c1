#pragma once

#include <cstddef>
#include <vector>

namespace gearpix::core {

constexpr size_t NUM_CHANNELS = 4;
constexpr size_t CHANNEL_R = 0;
constexpr size_t CHANNEL_G = 1;
constexpr size_t CHANNEL_B = 2;
constexpr size_t CHANNEL_A = 3;
constexpr int MAX_CHANNEL_VALUE = 255;
// Largest width or height any stage will allocate.
constexpr int MAX_IMAGE_DIMENSION = 32768;

struct Color {
    unsigned char r = 0;
    unsigned char g = 0;
    unsigned char b = 0;
    unsigned char a = 0;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    [[nodiscard]] bool is_transparent() const {
        return a == 0;
    }
};

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

// Normalized placement point: 0 = left/top, 0.5 = center, 1 = right/bottom.
struct Anchor {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Anchor& other) const {
        return x == other.x && y == other.y;
    }
};

constexpr Anchor ANCHOR_CENTER{.x = 0.5, .y = 0.5};

// Owned, row-major RGBA8 pixel grid. at() and set() throw std::out_of_range
// outside the grid.
class PixelBuffer {
public:
    PixelBuffer() = default;
    PixelBuffer(int width, int height);
    PixelBuffer(int width, int height, std::vector<unsigned char> rgba);

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }
    [[nodiscard]] bool empty() const { return width_ <= 0 || height_ <= 0; }
    [[nodiscard]] bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    [[nodiscard]] Color at(int x, int y) const;
    void set(int x, int y, const Color& color);
    void fill(const Color& color);

    // Copies the sub-rectangle, which must lie inside the buffer.
    [[nodiscard]] PixelBuffer crop(const Rect& rect) const;

    // Plain copy of src at (x, y), clipped to this buffer.
    void blit(const PixelBuffer& src, int x, int y);

    [[nodiscard]] const unsigned char* data() const { return rgba_.data(); }
    [[nodiscard]] unsigned char* data() { return rgba_.data(); }
    [[nodiscard]] size_t byte_size() const { return rgba_.size(); }

    bool operator==(const PixelBuffer& other) const {
        return width_ == other.width_ && height_ == other.height_ && rgba_ == other.rgba_;
    }

    bool operator!=(const PixelBuffer& other) const {
        return !(*this == other);
    }

private:
    [[nodiscard]] size_t offset_of(int x, int y) const;

    int width_ = 0;
    int height_ = 0;
    std::vector<unsigned char> rgba_;
};

} // namespace gearpix::core
