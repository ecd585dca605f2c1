#pragma once

#include <filesystem>
#include <vector>

#include "pipeline_error.h"

namespace gearpix::core {

namespace fs = std::filesystem;

// "<dir>/<stem without variant markers>-shadow<ext>"; must exist.
bool infer_shadow_path(const fs::path& texture, fs::path& out, PipelineError& error);

// "<dir>/<stem>-variant1<ext>" ... "<dir>/<stem>-variantN<ext>"; the
// "-variant" marker is only added when the stem lacks it. All must exist.
bool expand_variant_paths(const fs::path& texture, int variants, std::vector<fs::path>& out, PipelineError& error);

// "<output_dir or the texture's dir>/<stem>-processed.png".
fs::path processed_output_path(const fs::path& texture, const fs::path& output_dir = {});

} // namespace gearpix::core
