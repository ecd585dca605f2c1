#pragma once

#include <filesystem>
#include <iosfwd>
#include <vector>

#include "drop_shadow.h"
#include "pipeline_error.h"

namespace gearpix::core {

namespace fs = std::filesystem;

struct IconConfig {
    std::vector<fs::path> inputs;    // image files and/or tar archives of images
    fs::path output_dir;             // empty: next to each source (or its archive)
    ShadowSpec shadow;
    unsigned int threads = 0;        // 0: hardware concurrency
};

struct IconJob {
    fs::path source;
    fs::path output;
};

struct IconBatchSummary {
    size_t processed = 0;
    size_t failed = 0;
};

// Loads one texture, composes its icon atlas and writes it to job.output.
bool process_icon_file(const IconJob& job, const ShadowSpec& shadow, std::ostream& log, PipelineError& error);

// Runs every input through process_icon_file. Setup problems (missing inputs,
// unreadable archives) fail the whole batch before any pixel work; a failing
// image is reported on errors and counted without stopping its siblings.
bool run_icon_batch(const IconConfig& config,
                    std::ostream& log,
                    std::ostream& errors,
                    IconBatchSummary& summary,
                    PipelineError& error);

} // namespace gearpix::core
