// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file al_toolchain.cpp
 * @brief External assembler/linker driver implementation.
 */

#include "al_toolchain.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sys/wait.h>
#include <unistd.h>

namespace asmlower {

namespace {

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // anonymous namespace

std::vector<std::string> default_toolchain_commands() {
    return {
        "nasm -f elf64 {input} -o {object}",
        "ld {object} -o {output}",
    };
}

std::string expand_command(const std::string& command_template,
                           const std::filesystem::path& input,
                           const std::filesystem::path& object,
                           const std::filesystem::path& output) {
    std::string cmd = command_template;
    replace_all(cmd, "{input}", shell_quote(input.string()));
    replace_all(cmd, "{object}", shell_quote(object.string()));
    replace_all(cmd, "{output}", shell_quote(output.string()));
    return cmd;
}

// ============== TempArtifacts ==============

TempArtifacts::TempArtifacts() {
    static std::atomic<uint64_t> counter{0};
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();

    for (int attempt = 0; attempt < 100; ++attempt) {
        auto candidate = base / ("asmlower-" + std::to_string(::getpid()) + "-" +
                                 std::to_string(stamp) + "-" + std::to_string(counter.fetch_add(1)));
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            dir_ = candidate;
            return;
        }
    }
    throw std::runtime_error("Cannot create a temporary directory under " + base.string());
}

TempArtifacts::~TempArtifacts() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
}

// ============== Toolchain ==============

Toolchain::Toolchain(std::vector<std::string> commands)
    : commands_(std::move(commands)) {
    if (commands_.empty()) {
        throw std::invalid_argument("Toolchain needs at least one command");
    }
}

std::string Toolchain::run(const std::string& command, int& exit_code) {
    const std::string full = command + " 2>&1";
    FILE* pipe = ::popen(full.c_str(), "r");
    if (!pipe) {
        throw ToolchainFailure(command, -1, "could not start process");
    }

    std::string output;
    char buffer[4096];
    size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }

    const int status = ::pclose(pipe);
    if (status == -1) {
        exit_code = -1;
    } else if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    } else {
        exit_code = -1;
    }
    return output;
}

void Toolchain::build(const std::string& listing, const BinaryCallback& on_binary) const {
    TempArtifacts artifacts;

    {
        std::ofstream out(artifacts.input(), std::ios::binary);
        if (!out) {
            throw ToolchainFailure("write " + artifacts.input().string(), -1, "cannot open listing file");
        }
        out << listing;
        if (!out) {
            throw ToolchainFailure("write " + artifacts.input().string(), -1, "cannot write listing file");
        }
    }

    for (const auto& tmpl : commands_) {
        const std::string cmd = expand_command(tmpl, artifacts.input(), artifacts.object(), artifacts.output());
        int exit_code = 0;
        std::string diagnostics = run(cmd, exit_code);
        if (exit_code != 0) {
            throw ToolchainFailure(cmd, exit_code, diagnostics);
        }
    }

    if (!std::filesystem::exists(artifacts.output())) {
        throw ToolchainFailure(commands_.back(), 0, "no binary was produced");
    }

    if (on_binary) {
        on_binary(artifacts.output());
    }
}

} // namespace asmlower
