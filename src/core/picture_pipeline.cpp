#include "picture_pipeline.h"

#include "alignment.h"
#include "alpha_trim.h"
#include "aspect_resize.h"
#include "image_io.h"
#include "sprite_sheet.h"
#include "texture_paths.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

namespace gearpix::core {

namespace {

std::string size_text(const PixelBuffer& buffer) {
    return std::to_string(buffer.width()) + "x" + std::to_string(buffer.height());
}

} // namespace

bool resolve_picture_inputs(const PictureConfig& config,
                            std::vector<fs::path>& textures,
                            std::optional<fs::path>& shadow,
                            PipelineError& error) {
    if (config.textures.empty()) {
        return fail(error, ErrorCode::MissingResource, "no texture files given");
    }
    if (config.variants > 1 && config.textures.size() != 1) {
        return fail(error, ErrorCode::InvalidArgument,
                    "exactly one texture must be given when variants is greater than 1");
    }

    std::optional<fs::path> resolved_shadow = config.shadow;
    if (config.infer_shadow && !resolved_shadow) {
        fs::path inferred;
        if (!infer_shadow_path(config.textures.front(), inferred, error)) {
            return false;
        }
        resolved_shadow = inferred;
    }

    std::vector<fs::path> resolved = config.textures;
    if (config.variants > 1) {
        if (!expand_variant_paths(config.textures.front(), config.variants, resolved, error)) {
            return false;
        }
    }

    std::error_code ec;
    for (const auto& path : resolved) {
        if (!fs::is_regular_file(path, ec)) {
            return fail(error, ErrorCode::MissingResource, "texture file not found: " + path.string());
        }
    }
    if (resolved_shadow && !fs::is_regular_file(*resolved_shadow, ec)) {
        return fail(error, ErrorCode::MissingResource, "shadow file not found: " + resolved_shadow->string());
    }

    textures = std::move(resolved);
    shadow = std::move(resolved_shadow);
    return true;
}

bool process_picture(std::vector<PixelBuffer> frames,
                     std::optional<PixelBuffer> shadow,
                     double scale,
                     const Anchor& alignment,
                     PictureResult& out,
                     std::ostream& log,
                     PipelineError& error) {
    if (frames.empty()) {
        return fail(error, ErrorCode::MissingResource, "no images to process");
    }
    for (size_t i = 1; i < frames.size(); ++i) {
        if (frames[i].width() != frames[0].width() || frames[i].height() != frames[0].height()) {
            return fail(error, ErrorCode::DimensionMismatch,
                        "all textures must have the same dimensions: image " + std::to_string(i + 1) + " is "
                            + size_text(frames[i]) + ", image 1 is " + size_text(frames[0]));
        }
    }

    const bool single = frames.size() == 1;
    double image_scale = 1.0;
    for (size_t i = 0; i < frames.size(); ++i) {
        const std::string label = single ? "image" : "image " + std::to_string(i + 1);
        if (!trim_transparent(frames[i], error)) {
            error.message = label + ": " + error.message;
            return false;
        }
        if (i == 0) {
            image_scale = PICTURE_TARGET_SIZE / std::max(frames[0].width(), frames[0].height());
        }
        log << "Trimmed whitespace, cropped " << label << " to: " << size_text(frames[i]) << "\n";

        ResizeSpec spec;
        spec.target_size = PICTURE_TARGET_SIZE;
        spec.scale = scale;
        PixelBuffer resized;
        if (!resize_with_aspect(frames[i], spec, resized, error)) {
            error.message = label + ": " + error.message;
            return false;
        }
        frames[i] = std::move(resized);
        log << "Resized " << label << " to: " << size_text(frames[i]) << "\n";
    }

    if (shadow) {
        if (!trim_transparent(*shadow, error)) {
            error.message = "shadow: " + error.message;
            return false;
        }
        log << "Trimmed whitespace, cropped shadow to: " << size_text(*shadow) << "\n";

        // The shadow keeps the same pixel ratio as the first image.
        const double target_size = std::max(shadow->width(), shadow->height()) * image_scale;
        ResizeSpec spec;
        spec.target_size = target_size;
        spec.scale = scale;
        PixelBuffer resized;
        if (!resize_with_aspect(*shadow, spec, resized, error)) {
            error.message = "shadow: " + error.message;
            return false;
        }
        shadow = std::move(resized);
        log << "Resized shadow to: " << size_text(*shadow) << "\n";
    }

    PictureResult result;
    result.frame_count = frames.size();
    result.frame = frames.front();
    if (single) {
        result.image = std::move(frames.front());
    } else {
        if (!compose_sprite_sheet(frames, result.image, error)) {
            return false;
        }
        log << "Loaded spritesheet: " << size_text(result.image) << "\n"
            << "Individual sprite size: " << size_text(result.frame) << "\n"
            << "Variation count: " << frames.size() << "\n"
            << "Line length: " << frames.size() << "\n"
            << "Shadow repeat: " << frames.size() << "\n";
    }
    result.shadow = std::move(shadow);

    describe_alignment(result.frame, result.shadow ? &*result.shadow : nullptr, alignment, log);
    out = std::move(result);
    return true;
}

bool run_picture_pipeline(const PictureConfig& config, std::ostream& log, PipelineError& error) {
    std::vector<fs::path> textures;
    std::optional<fs::path> shadow_path;
    if (!resolve_picture_inputs(config, textures, shadow_path, error)) {
        return false;
    }

    std::vector<PixelBuffer> frames;
    frames.reserve(textures.size());
    for (const auto& path : textures) {
        PixelBuffer image;
        if (!load_image(path, image, error)) {
            return false;
        }
        log << "Loaded image: " << path.string() << " (" << size_text(image) << ")\n";
        frames.push_back(std::move(image));
    }

    std::optional<PixelBuffer> shadow;
    if (shadow_path) {
        PixelBuffer image;
        if (!load_image(*shadow_path, image, error)) {
            return false;
        }
        log << "Loaded shadow: " << shadow_path->string() << " (" << size_text(image) << ")\n";
        shadow = std::move(image);
    }

    PictureResult result;
    if (!process_picture(std::move(frames), std::move(shadow), config.scale, config.alignment, result, log, error)) {
        return false;
    }

    const fs::path output_path = processed_output_path(textures.front());
    if (!save_png(output_path, result.image, error)) {
        return false;
    }
    log << "Wrote " << output_path.string() << "\n";
    if (result.shadow) {
        const fs::path shadow_output = processed_output_path(*shadow_path);
        if (!save_png(shadow_output, *result.shadow, error)) {
            return false;
        }
        log << "Wrote " << shadow_output.string() << "\n";
    }
    return true;
}

} // namespace gearpix::core
