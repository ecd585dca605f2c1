#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <vector>

#include "pipeline_error.h"
#include "pixel_buffer.h"

namespace gearpix::core {

namespace fs = std::filesystem;

constexpr double PICTURE_TARGET_SIZE = 64.0;

struct PictureConfig {
    std::vector<fs::path> textures;
    std::optional<fs::path> shadow;
    bool infer_shadow = false;       // --shadow given without a file
    int variants = 1;
    double scale = 1.0;
    Anchor alignment{};
};

struct PictureResult {
    PixelBuffer image;               // single picture or sprite sheet
    PixelBuffer frame;               // one processed frame, used for offsets
    std::optional<PixelBuffer> shadow;
    size_t frame_count = 0;
};

// Applies shadow inference and variant expansion; every file named must exist.
bool resolve_picture_inputs(const PictureConfig& config,
                            std::vector<fs::path>& textures,
                            std::optional<fs::path>& shadow,
                            PipelineError& error);

// Trims and resizes every frame (and the shadow, at the first frame's ratio),
// composing a sprite sheet when there is more than one frame.
bool process_picture(std::vector<PixelBuffer> frames,
                     std::optional<PixelBuffer> shadow,
                     double scale,
                     const Anchor& alignment,
                     PictureResult& out,
                     std::ostream& log,
                     PipelineError& error);

// Resolves, loads, processes and writes "<stem>-processed.png" outputs.
bool run_picture_pipeline(const PictureConfig& config, std::ostream& log, PipelineError& error);

} // namespace gearpix::core
