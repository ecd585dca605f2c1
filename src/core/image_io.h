#pragma once

#include <filesystem>

#include "pipeline_error.h"
#include "pixel_buffer.h"

namespace gearpix::core {

// Decodes any stb_image format, always expanded to RGBA8.
bool load_image(const std::filesystem::path& path, PixelBuffer& out, PipelineError& error);

bool save_png(const std::filesystem::path& path, const PixelBuffer& buffer, PipelineError& error);

bool is_supported_image_extension(const std::filesystem::path& path);

} // namespace gearpix::core
