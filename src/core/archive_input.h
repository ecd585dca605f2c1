#pragma once

#include <filesystem>
#include <vector>

#include "pipeline_error.h"

namespace gearpix::core {

namespace fs = std::filesystem;

struct ExtractedArchive {
    fs::path archive_path;
    fs::path working_folder;          // temporary, removed by cleanup()
    std::vector<fs::path> images;     // sorted

    void cleanup();
};

// .tar and compressed tar names (.tar.gz, .tgz, .tar.bz2, .tbz2, .tar.xz, .txz).
bool is_archive_path(const fs::path& path);

// Extracts every entry into a fresh temporary folder and lists the images in it.
bool extract_archive_images(const fs::path& archive, ExtractedArchive& out, PipelineError& error);

} // namespace gearpix::core
