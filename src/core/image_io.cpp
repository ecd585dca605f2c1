#include "image_io.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace gearpix::core {

namespace {

constexpr size_t k_max_total_pixels = 100000000;

} // namespace

bool load_image(const std::filesystem::path& path, PixelBuffer& out, PipelineError& error) {
    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* data = stbi_load(path.string().c_str(), &width, &height, &channels, static_cast<int>(NUM_CHANNELS));
    if (data == nullptr) {
        const char* reason = stbi_failure_reason();
        return fail(error, ErrorCode::ImageLoad,
                    "failed to load image: " + path.string() + (reason != nullptr ? std::string(" (") + reason + ")" : ""));
    }

    if (width <= 0 || height <= 0 || width > MAX_IMAGE_DIMENSION || height > MAX_IMAGE_DIMENSION
        || static_cast<size_t>(width) * static_cast<size_t>(height) > k_max_total_pixels) {
        stbi_image_free(data);
        return fail(error, ErrorCode::ImageLoad,
                    "invalid image dimensions " + std::to_string(width) + "x" + std::to_string(height)
                        + ": " + path.string());
    }

    const size_t byte_count = static_cast<size_t>(width) * static_cast<size_t>(height) * NUM_CHANNELS;
    std::vector<unsigned char> rgba(data, data + byte_count);
    stbi_image_free(data);
    out = PixelBuffer(width, height, std::move(rgba));
    return true;
}

bool save_png(const std::filesystem::path& path, const PixelBuffer& buffer, PipelineError& error) {
    if (buffer.empty()) {
        return fail(error, ErrorCode::ImageSave, "refusing to write an empty image: " + path.string());
    }
    const int stride = buffer.width() * static_cast<int>(NUM_CHANNELS);
    if (stbi_write_png(path.string().c_str(), buffer.width(), buffer.height(),
                       static_cast<int>(NUM_CHANNELS), buffer.data(), stride) == 0) {
        return fail(error, ErrorCode::ImageSave, "failed to write PNG: " + path.string());
    }
    return true;
}

bool is_supported_image_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext.empty() || ext.size() > 10) {
        return false;
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" ||
           ext == ".tga" || ext == ".gif" || ext == ".psd" || ext == ".pic" ||
           ext == ".pnm" || ext == ".pgm" || ext == ".ppm" || ext == ".hdr";
}

} // namespace gearpix::core
