#include "icon_pipeline.h"

#include "archive_input.h"
#include "icon_atlas.h"
#include "image_io.h"
#include "texture_paths.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace gearpix::core {

namespace {

struct JobOutcome {
    bool ok = false;
    std::string log;
    PipelineError error;
};

bool collect_jobs(const IconConfig& config,
                  std::vector<IconJob>& jobs,
                  std::vector<ExtractedArchive>& archives,
                  PipelineError& error) {
    std::error_code ec;
    for (const auto& input : config.inputs) {
        if (!fs::is_regular_file(input, ec)) {
            return fail(error, ErrorCode::MissingResource, "input file not found: " + input.string());
        }
    }

    for (const auto& input : config.inputs) {
        if (!is_archive_path(input)) {
            jobs.push_back(IconJob{.source = input, .output = processed_output_path(input, config.output_dir)});
            continue;
        }
        ExtractedArchive extracted;
        if (!extract_archive_images(input, extracted, error)) {
            return false;
        }
        const fs::path output_dir = config.output_dir.empty()
                                        ? (input.parent_path().empty() ? fs::path(".") : input.parent_path())
                                        : config.output_dir;
        for (const auto& image : extracted.images) {
            jobs.push_back(IconJob{.source = image, .output = processed_output_path(image, output_dir)});
        }
        archives.push_back(std::move(extracted));
    }

    // Workers write in parallel, so every output file must belong to one job.
    std::map<fs::path, const IconJob*> outputs;
    for (const auto& job : jobs) {
        fs::path key = fs::absolute(job.output, ec);
        key = ec ? job.output.lexically_normal() : key.lexically_normal();
        const auto [it, inserted] = outputs.emplace(key, &job);
        if (!inserted) {
            return fail(error, ErrorCode::InvalidArgument,
                        "inputs " + it->second->source.string() + " and " + job.source.string()
                            + " would both write " + job.output.string());
        }
    }
    return true;
}

} // namespace

bool process_icon_file(const IconJob& job, const ShadowSpec& shadow, std::ostream& log, PipelineError& error) {
    PixelBuffer image;
    if (!load_image(job.source, image, error)) {
        return false;
    }
    log << "Loaded image: " << job.source.string() << " (" << image.width() << "x" << image.height() << ")\n";

    PixelBuffer atlas;
    if (!compose_icon_atlas(image, shadow, atlas, log, error)) {
        error.message = job.source.string() + ": " + error.message;
        return false;
    }
    if (!save_png(job.output, atlas, error)) {
        return false;
    }
    log << "Wrote " << job.output.string() << "\n";
    return true;
}

bool run_icon_batch(const IconConfig& config,
                    std::ostream& log,
                    std::ostream& errors,
                    IconBatchSummary& summary,
                    PipelineError& error) {
    if (config.inputs.empty()) {
        return fail(error, ErrorCode::MissingResource, "no input textures given");
    }
    if (!validate_shadow_spec(config.shadow, error)) {
        return false;
    }
    if (!config.output_dir.empty()) {
        std::error_code ec;
        if (!fs::is_directory(config.output_dir, ec)) {
            return fail(error, ErrorCode::MissingResource, "output directory not found: " + config.output_dir.string());
        }
    }

    std::vector<IconJob> jobs;
    std::vector<ExtractedArchive> archives;
    if (!collect_jobs(config, jobs, archives, error)) {
        for (auto& archive : archives) {
            archive.cleanup();
        }
        return false;
    }

    std::vector<JobOutcome> outcomes(jobs.size());
    auto run_job = [&](size_t index) {
        std::ostringstream job_log;
        JobOutcome& outcome = outcomes[index];
        outcome.ok = process_icon_file(jobs[index], config.shadow, job_log, outcome.error);
        outcome.log = job_log.str();
    };

    unsigned int worker_count = config.threads > 0 ? config.threads : std::thread::hardware_concurrency();
    if (worker_count == 0) {
        worker_count = 1;
    }
    worker_count = std::min<unsigned int>(worker_count, static_cast<unsigned int>(std::max<size_t>(1, jobs.size())));

    if (worker_count <= 1) {
        for (size_t i = 0; i < jobs.size(); ++i) {
            run_job(i);
        }
    } else {
        // Each job owns its buffers; only the next index is shared.
        std::atomic<size_t> next_index{0};
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (unsigned int i = 0; i < worker_count; ++i) {
            workers.emplace_back([&]() {
                while (true) {
                    size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
                    if (idx >= jobs.size()) {
                        break;
                    }
                    run_job(idx);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    summary = IconBatchSummary{};
    for (const auto& outcome : outcomes) {
        log << outcome.log;
        if (outcome.ok) {
            ++summary.processed;
        } else {
            ++summary.failed;
            errors << "Error: " << outcome.error.message << " [" << error_code_name(outcome.error.code) << "]\n";
        }
    }

    for (auto& archive : archives) {
        archive.cleanup();
    }
    return true;
}

} // namespace gearpix::core
