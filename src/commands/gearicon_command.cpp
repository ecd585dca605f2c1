// gearicon_command.cpp
// MIT License (c) 2026 Pedro

#include <iostream>
#include <string>
#include <filesystem>
namespace fs = std::filesystem;
#include "commands.h"
#include "core/cli_parse.h"
#include "core/icon_pipeline.h"

// Configuration
constexpr int k_default_threads = 0; // Auto-detect

namespace {
using gearpix::core::IconBatchSummary;
using gearpix::core::IconConfig;
using gearpix::core::parse_color;
using gearpix::core::parse_int_pair;
using gearpix::core::parse_non_negative_int;
using gearpix::core::parse_positive_int;
using gearpix::core::PipelineError;

void print_usage() {
    const auto& shadow = gearpix::core::DEFAULT_SHADOW_COLOR;
    std::cout << "Usage: gearicon [OPTIONS] <input>...\n\n"
        << "Build 120x64 icon atlases (64, 32, 16 and 8 px layers) with a drop shadow.\n"
        << "Inputs are image files or tar archives of images.\n\n"
        << "Options:\n"
        << "  --shadow-offset DX,DY     Shadow offset in pixels (default: 0,0)\n"
        << "  --shadow-blur N           Shadow blur radius (default: "
        << gearpix::core::DEFAULT_SHADOW_BLUR_RADIUS << ")\n"
        << "  --shadow-color R,G,B[,A]  Shadow color (default: " << static_cast<int>(shadow.r) << ","
        << static_cast<int>(shadow.g) << "," << static_cast<int>(shadow.b) << ","
        << static_cast<int>(shadow.a) << ")\n"
        << "  --output-dir DIR          Directory for the processed files (default: next to each input)\n"
        << "  --threads N              Number of threads to use (default: " << k_default_threads << " = auto)\n"
        << "  --help, -h               Show this help message\n\n"
        << "Examples:\n"
        << "  gearicon item.png\n"
        << "  gearicon --shadow-offset 1,1 --shadow-blur 1 icons.tar.gz\n"
        << "  gearicon --output-dir out a.png b.png\n";
}

} // namespace

int run_gearicon(int argc, char** argv) {
    IconConfig config;
    config.threads = k_default_threads;
    bool show_help = argc <= 1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--shadow-offset" && i + 1 < argc) {
            if (!parse_int_pair(argv[++i], config.shadow.offset_x, config.shadow.offset_y)) {
                std::cerr << "Error: Invalid shadow offset: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--shadow-blur" && i + 1 < argc) {
            if (!parse_non_negative_int(argv[++i], config.shadow.blur_radius)) {
                std::cerr << "Error: Invalid shadow blur value: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--shadow-color" && i + 1 < argc) {
            if (!parse_color(argv[++i], config.shadow.color)) {
                std::cerr << "Error: Invalid color format: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--output-dir" && i + 1 < argc) {
            config.output_dir = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            int threads_int = 0;
            if (!parse_positive_int(argv[++i], threads_int)) {
                std::cerr << "Error: Invalid threads value: " << argv[i] << '\n';
                return 1;
            }
            config.threads = static_cast<unsigned int>(threads_int);
        } else if (arg.empty() || arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return 1;
        } else {
            config.inputs.emplace_back(arg);
        }
    }

    if (show_help) {
        print_usage();
        return 0;
    }

    if (config.inputs.empty()) {
        std::cerr << "Error: At least one input file is required" << '\n';
        print_usage();
        return 1;
    }

    PipelineError error;
    IconBatchSummary summary;
    if (!gearpix::core::run_icon_batch(config, std::cout, std::cerr, summary, error)) {
        std::cerr << "Error: " << error.message << '\n';
        return 1;
    }
    if (summary.failed > 0) {
        std::cerr << "Error: " << summary.failed << " of " << (summary.processed + summary.failed)
                  << " images failed" << '\n';
        return 1;
    }
    return 0;
}
