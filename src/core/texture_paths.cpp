#include "texture_paths.h"

#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace gearpix::core {

namespace {

constexpr std::string_view k_variant_marker = "-variant";
constexpr std::string_view k_bare_variant_marker = "variant";
constexpr std::string_view k_shadow_suffix = "-shadow";
constexpr std::string_view k_processed_suffix = "-processed.png";

void erase_all(std::string& text, std::string_view needle) {
    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        text.erase(pos, needle.size());
        pos = text.find(needle, pos);
    }
}

fs::path directory_of(const fs::path& texture) {
    fs::path dir = texture.parent_path();
    return dir.empty() ? fs::path(".") : dir;
}

bool regular_file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace

bool infer_shadow_path(const fs::path& texture, fs::path& out, PipelineError& error) {
    std::string base = texture.stem().string();
    erase_all(base, k_variant_marker);
    erase_all(base, k_bare_variant_marker);

    const fs::path candidate = directory_of(texture) / (base + std::string(k_shadow_suffix) + texture.extension().string());
    if (!regular_file_exists(candidate)) {
        return fail(error, ErrorCode::MissingResource, "shadow file not found: " + candidate.string());
    }
    out = candidate;
    return true;
}

bool expand_variant_paths(const fs::path& texture, int variants, std::vector<fs::path>& out, PipelineError& error) {
    if (variants < 1) {
        return fail(error, ErrorCode::InvalidArgument, "variant count must be at least 1");
    }
    std::string base = texture.stem().string();
    if (base.find(k_variant_marker) == std::string::npos) {
        base += k_variant_marker;
    }
    const fs::path dir = directory_of(texture);
    const std::string extension = texture.extension().string();

    std::vector<fs::path> paths;
    paths.reserve(static_cast<size_t>(variants));
    for (int i = 1; i <= variants; ++i) {
        fs::path variant = dir / (base + std::to_string(i) + extension);
        if (!regular_file_exists(variant)) {
            return fail(error, ErrorCode::MissingResource, "variant file not found: " + variant.string());
        }
        paths.push_back(std::move(variant));
    }
    out = std::move(paths);
    return true;
}

fs::path processed_output_path(const fs::path& texture, const fs::path& output_dir) {
    const fs::path dir = output_dir.empty() ? directory_of(texture) : output_dir;
    return dir / (texture.stem().string() + std::string(k_processed_suffix));
}

} // namespace gearpix::core
