#include "compositing.h"

#include <algorithm>
#include <cmath>

namespace gearpix::core {

namespace {

unsigned char to_channel(double value) {
    return static_cast<unsigned char>(std::clamp<long>(std::lround(value), 0, MAX_CHANNEL_VALUE));
}

} // namespace

Color blend_over(const Color& dst, const Color& src) {
    if (src.a == MAX_CHANNEL_VALUE || dst.a == 0) {
        return src.a == 0 ? Color{} : src;
    }
    if (src.a == 0) {
        return dst;
    }
    const double src_a = src.a / 255.0;
    const double dst_a = dst.a / 255.0;
    const double dst_weight = dst_a * (1.0 - src_a);
    const double out_a = src_a + dst_weight;
    return Color{
        .r = to_channel(((src.r * src_a) + (dst.r * dst_weight)) / out_a),
        .g = to_channel(((src.g * src_a) + (dst.g * dst_weight)) / out_a),
        .b = to_channel(((src.b * src_a) + (dst.b * dst_weight)) / out_a),
        .a = to_channel(out_a * 255.0),
    };
}

void draw_over(PixelBuffer& dst, const PixelBuffer& src, int x, int y) {
    const int left = std::max(0, x);
    const int top = std::max(0, y);
    const int right = std::min(dst.width(), x + src.width());
    const int bottom = std::min(dst.height(), y + src.height());
    for (int dy = top; dy < bottom; ++dy) {
        for (int dx = left; dx < right; ++dx) {
            const Color over = src.at(dx - x, dy - y);
            if (over.a == 0) {
                continue;
            }
            dst.set(dx, dy, blend_over(dst.at(dx, dy), over));
        }
    }
}

} // namespace gearpix::core
