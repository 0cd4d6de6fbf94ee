// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file asmlower_cli.cpp
 * @brief asmlower command-line interface.
 *
 * Provides emit, build and run commands that lower a JSON syntax tree to
 * x86-64 NASM. Entry point for the asmlower executable.
 */

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "al_compiler.hpp"
#include "al_config.hpp"
#include "al_core.hpp"
#include "al_listing.hpp"
#include "al_machine.hpp"
#include "al_optimizer.hpp"
#include "al_toolchain.hpp"
#include "al_tree_reader.hpp"

using namespace asmlower;

namespace {

constexpr const char* DEFAULT_CONFIG = "asmlower.json";
constexpr const char* DEFAULT_ENTRY = "main";

void print_usage() {
    std::cerr << R"(
asmlower - syntax tree to x86-64 lowering v)" << VERSION << R"(

Usage: asmlower <command> [options]

Commands:
  emit <tree.json>            Write the NASM listing
      -o, --output <path>     Output file [default: stdout]

  build <tree.json>           Emit, assemble and link
      -o, --output <path>     Binary path (required)

  run <tree.json> <function> [args...]
                              Lower and simulate one function call

  version                     Show version information
  help                        Show this help message

Options (emit, build, run):
  -C, --config <file>         Build configuration [default: ./asmlower.json if present]
  -O0                         Disable all optimization passes
  --no-dead-store             Disable dead-store elimination
  --no-peephole               Disable the peephole pass
  -j, --jobs <n>              Lower functions on n worker threads
  --entry <name>              Function called by the _start stub [build default: main]
  --verbose                   Print per-pass statistics

Examples:
  asmlower emit factorial.json -o factorial.asm
  asmlower build factorial.json -o factorial --entry main
  asmlower run factorial.json factorial 5
)";
}

void print_version() {
    std::cout << "asmlower version " << VERSION << "\n";
    std::cout << "x86-64 NASM lowering engine\n";
}

struct Options {
    std::vector<std::string> positional;
    std::filesystem::path output;
    std::filesystem::path config_path;
    bool all_off = false;
    bool no_dead_store = false;
    bool no_peephole = false;
    std::optional<size_t> jobs;
    std::optional<std::string> entry;
    bool verbose = false;
};

bool parse_options(int argc, char* argv[], Options& opts, std::string& err) {
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            opts.output = argv[++i];
        } else if ((arg == "-C" || arg == "--config") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "-O0") {
            opts.all_off = true;
        } else if (arg == "--no-dead-store") {
            opts.no_dead_store = true;
        } else if (arg == "--no-peephole") {
            opts.no_peephole = true;
        } else if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
            const std::string value = argv[++i];
            if (value.empty() || value.size() > 4 ||
                value.find_first_not_of("0123456789") != std::string::npos || std::stoul(value) == 0) {
                err = "--jobs expects a positive integer, got '" + value + "'";
                return false;
            }
            opts.jobs = std::stoul(value);
        } else if (arg == "--entry" && i + 1 < argc) {
            opts.entry = argv[++i];
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg.find_first_not_of("0123456789", 1) != std::string::npos) {
            err = "Unknown option '" + arg + "'";
            return false;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return true;
}

// File values first, then command-line overrides.
bool resolve_config(const Options& opts, BuildConfig& cfg, std::string& err) {
    if (!opts.config_path.empty()) {
        if (!LoadBuildConfig(opts.config_path, cfg, err)) return false;
    } else if (std::filesystem::exists(DEFAULT_CONFIG)) {
        if (!LoadBuildConfig(DEFAULT_CONFIG, cfg, err)) return false;
    }

    if (opts.all_off) {
        cfg.dead_store = false;
        cfg.peephole = false;
    }
    if (opts.no_dead_store) cfg.dead_store = false;
    if (opts.no_peephole) cfg.peephole = false;
    if (opts.jobs) cfg.jobs = *opts.jobs;
    if (opts.entry) cfg.entry = opts.entry;
    return true;
}

Program lower(const std::filesystem::path& tree_path, const BuildConfig& cfg, bool verbose) {
    Module module = load_tree(tree_path);

    CompilationContext ctx;
    Compiler compiler(ctx);
    Program program = compiler.compile(module, cfg.jobs);

    OptimizationPipeline pipeline = OptimizationPipeline::standard();
    pipeline.set_enabled("dead-store", cfg.dead_store);
    pipeline.set_enabled("peephole", cfg.peephole);
    Program optimized = pipeline.run(program);

    // stdout may carry the listing, so statistics go to stderr.
    if (verbose) {
        std::cerr << "Lowered " << optimized.units.size() << " function(s), "
                  << optimized.globals.size() << " global(s)\n";
        for (const auto& s : pipeline.stats()) {
            std::cerr << "  " << s.pass << (pipeline.is_enabled(s.pass) ? "" : " (disabled)")
                      << ": removed " << s.removed << " instruction(s)\n";
        }
    }
    return optimized;
}

// ============== Emit ==============
int cmd_emit(int argc, char* argv[]) {
    Options opts;
    std::string err;
    if (!parse_options(argc, argv, opts, err)) {
        std::cerr << "Error: " << err << "\n";
        return 1;
    }
    if (opts.positional.size() != 1) {
        std::cerr << "Error: Missing tree file\n";
        std::cerr << "Usage: asmlower emit <tree.json> [options]\n";
        return 1;
    }

    BuildConfig cfg;
    if (!resolve_config(opts, cfg, err)) {
        std::cerr << "Error: Failed to load configuration: " << err << "\n";
        return 1;
    }

    try {
        Program program = lower(opts.positional[0], cfg, opts.verbose);
        ListingOptions listing_opts;
        listing_opts.entry = cfg.entry;
        std::string listing = render_listing(program, listing_opts);

        if (opts.output.empty()) {
            std::cout << listing;
            return 0;
        }

        std::ofstream out(opts.output, std::ios::binary);
        if (!out) {
            std::cerr << "Error: Cannot open output file: " << opts.output.string() << "\n";
            return 1;
        }
        out << listing;
        std::cout << "Emit complete: " << opts.output.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== Build ==============
int cmd_build(int argc, char* argv[]) {
    Options opts;
    std::string err;
    if (!parse_options(argc, argv, opts, err)) {
        std::cerr << "Error: " << err << "\n";
        return 1;
    }
    if (opts.positional.size() != 1 || opts.output.empty()) {
        std::cerr << "Error: Missing tree file or output path\n";
        std::cerr << "Usage: asmlower build <tree.json> -o <binary> [options]\n";
        return 1;
    }

    BuildConfig cfg;
    if (!resolve_config(opts, cfg, err)) {
        std::cerr << "Error: Failed to load configuration: " << err << "\n";
        return 1;
    }
    if (!cfg.entry) {
        cfg.entry = DEFAULT_ENTRY;
    }

    try {
        Program program = lower(opts.positional[0], cfg, opts.verbose);
        ListingOptions listing_opts;
        listing_opts.entry = cfg.entry;
        std::string listing = render_listing(program, listing_opts);

        Toolchain toolchain(cfg.toolchain_commands.empty() ? default_toolchain_commands()
                                                           : cfg.toolchain_commands);
        const std::filesystem::path output = opts.output;
        toolchain.build(listing, [&](const std::filesystem::path& binary) {
            if (output.has_parent_path()) {
                std::filesystem::create_directories(output.parent_path());
            }
            std::filesystem::copy_file(binary, output, std::filesystem::copy_options::overwrite_existing);
        });

        std::cout << "Build complete: " << output.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: Build failed: " << e.what() << "\n";
        return 1;
    }
}

// ============== Run ==============
int cmd_run(int argc, char* argv[]) {
    Options opts;
    std::string err;
    if (!parse_options(argc, argv, opts, err)) {
        std::cerr << "Error: " << err << "\n";
        return 1;
    }
    if (opts.positional.size() < 2) {
        std::cerr << "Error: Missing tree file or function name\n";
        std::cerr << "Usage: asmlower run <tree.json> <function> [args...]\n";
        return 1;
    }

    BuildConfig cfg;
    if (!resolve_config(opts, cfg, err)) {
        std::cerr << "Error: Failed to load configuration: " << err << "\n";
        return 1;
    }

    try {
        std::vector<int64_t> args;
        for (size_t i = 2; i < opts.positional.size(); ++i) {
            args.push_back(std::stoll(opts.positional[i]));
        }

        Program program = lower(opts.positional[0], cfg, opts.verbose);
        Machine machine(program);
        int64_t result = machine.call(opts.positional[1], args);

        std::cout << "Result: " << result << "\n";
        if (opts.verbose) {
            std::cerr << "Executed " << machine.steps() << " instruction(s)\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: Execution failed: " << e.what() << "\n";
        return 1;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    if (command == "emit") {
        return cmd_emit(argc - 2, argv + 2);
    } else if (command == "build") {
        return cmd_build(argc - 2, argv + 2);
    } else if (command == "run") {
        return cmd_run(argc - 2, argv + 2);
    } else if (command == "version" || command == "-v" || command == "--version") {
        print_version();
        return 0;
    } else if (command == "help" || command == "-h" || command == "--help") {
        print_usage();
        return 0;
    } else {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }
}
