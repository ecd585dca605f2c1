#include "sprite_sheet.h"

#include <limits>
#include <string>
#include <utility>

namespace gearpix::core {

namespace {

std::string size_text(const PixelBuffer& buffer) {
    return std::to_string(buffer.width()) + "x" + std::to_string(buffer.height());
}

} // namespace

bool compose_sprite_sheet(const std::vector<PixelBuffer>& frames, PixelBuffer& out, PipelineError& error) {
    if (frames.empty()) {
        return fail(error, ErrorCode::DimensionMismatch, "sprite sheet needs at least one frame");
    }
    const int frame_w = frames.front().width();
    const int frame_h = frames.front().height();
    for (size_t i = 1; i < frames.size(); ++i) {
        if (frames[i].width() != frame_w || frames[i].height() != frame_h) {
            return fail(error, ErrorCode::DimensionMismatch,
                        "frame " + std::to_string(i + 1) + " is " + size_text(frames[i])
                            + " but frame 1 is " + size_text(frames.front()));
        }
    }
    if (frame_w <= 0 || frame_h <= 0
        || frames.size() > static_cast<size_t>(std::numeric_limits<int>::max() / frame_w)) {
        return fail(error, ErrorCode::InvalidDimension,
                    "cannot lay out " + std::to_string(frames.size()) + " frames of " + size_text(frames.front()));
    }

    PixelBuffer sheet(static_cast<int>(frames.size()) * frame_w, frame_h);
    for (size_t i = 0; i < frames.size(); ++i) {
        sheet.blit(frames[i], static_cast<int>(i) * frame_w, 0);
    }
    out = std::move(sheet);
    return true;
}

} // namespace gearpix::core
