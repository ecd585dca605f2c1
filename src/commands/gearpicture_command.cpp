// gearpicture_command.cpp
// MIT License (c) 2026 Pedro

#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
namespace fs = std::filesystem;
#include "commands.h"
#include "core/alignment.h"
#include "core/cli_parse.h"
#include "core/picture_pipeline.h"

// Configuration
constexpr int k_default_variants = 1;
constexpr double k_default_scale = 1.0;

namespace {
using gearpix::core::parse_alignment;
using gearpix::core::parse_double;
using gearpix::core::parse_positive_int;
using gearpix::core::PictureConfig;
using gearpix::core::PipelineError;

bool is_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

void print_usage() {
    std::cout << "Usage: gearpicture --textures FILE [FILE...] [OPTIONS]\n\n"
        << "Trim, resize and align textures for 64px engine tiles.\n"
        << "Several textures (or --variants) are packed into one horizontal sprite sheet.\n\n"
        << "Options:\n"
        << "  --textures FILE...        Texture files to process (required)\n"
        << "  --shadow [FILE]           Process a shadow texture; without FILE it is inferred\n"
        << "                            as <stem>-shadow next to the first texture\n"
        << "  --variants N              Expand one texture to <stem>-variant1..N (default: "
        << k_default_variants << ")\n"
        << "  --scale F                 Extra scale applied after fitting to 64px (default: "
        << k_default_scale << ")\n"
        << "  --alignment A             Anchor as x,y in [0,1] or words like top-left, center\n"
        << "                            (default: 0,0)\n"
        << "  --help, -h                Show this help message\n\n"
        << "Examples:\n"
        << "  gearpicture --textures rock.png --shadow\n"
        << "  gearpicture --textures tree.png --variants 3 --alignment center-bottom\n"
        << "  gearpicture --textures a.png b.png c.png --scale 0.5\n";
}

} // namespace

int run_gearpicture(int argc, char** argv) {
    PictureConfig config;
    config.variants = k_default_variants;
    config.scale = k_default_scale;
    bool show_help = argc <= 1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--textures") {
            while (i + 1 < argc && !is_option(argv[i + 1])) {
                config.textures.emplace_back(argv[++i]);
            }
            if (config.textures.empty()) {
                std::cerr << "Error: --textures requires at least one file" << '\n';
                return 1;
            }
        } else if (arg == "--shadow") {
            if (i + 1 < argc && !is_option(argv[i + 1])) {
                config.shadow = fs::path(argv[++i]);
            } else {
                config.infer_shadow = true;
            }
        } else if (arg == "--variants" && i + 1 < argc) {
            if (!parse_positive_int(argv[++i], config.variants)) {
                std::cerr << "Error: Invalid variants value: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--scale" && i + 1 < argc) {
            double scale = 0.0;
            if (!parse_double(argv[++i], scale) || scale < 0.0) {
                std::cerr << "Error: Invalid scale value: " << argv[i] << '\n';
                return 1;
            }
            config.scale = scale;
        } else if (arg == "--alignment" && i + 1 < argc) {
            config.alignment = parse_alignment(argv[++i], std::cerr);
        } else {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return 1;
        }
    }

    if (show_help) {
        print_usage();
        return 0;
    }

    if (config.textures.empty()) {
        std::cerr << "Error: --textures is required" << '\n';
        print_usage();
        return 1;
    }
    if (config.variants > 1 && config.textures.size() != 1) {
        std::cerr << "Error: --variants requires exactly one texture" << '\n';
        return 1;
    }

    PipelineError error;
    if (!gearpix::core::run_picture_pipeline(config, std::cout, error)) {
        std::cerr << "Error: " << error.message << '\n';
        return 1;
    }
    return 0;
}
