// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file al_toolchain.hpp
 * @brief External assembler/linker driver.
 *
 * Writes a listing into a scratch directory, runs the configured command
 * templates over it and hands the resulting binary to the caller before
 * the scratch directory is removed.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace asmlower {

class ToolchainFailure : public std::runtime_error {
public:
    ToolchainFailure(std::string command, int exit_code, std::string diagnostics)
        : std::runtime_error(describe(command, exit_code, diagnostics))
        , command_(std::move(command))
        , exit_code_(exit_code)
        , diagnostics_(std::move(diagnostics)) {}

    const std::string& command() const { return command_; }
    int exit_code() const { return exit_code_; }
    const std::string& diagnostics() const { return diagnostics_; }

private:
    std::string command_;
    int exit_code_;
    std::string diagnostics_;

    static std::string describe(const std::string& command, int exit_code, const std::string& diagnostics) {
        std::string msg = "Toolchain command failed (exit " + std::to_string(exit_code) + "): " + command;
        if (!diagnostics.empty()) {
            msg += "\n" + diagnostics;
        }
        return msg;
    }
};

// nasm -f elf64 {input} -o {object}, then ld {object} -o {output}
std::vector<std::string> default_toolchain_commands();

// Replaces {input}, {object} and {output} with shell-quoted paths.
std::string expand_command(const std::string& command_template,
                           const std::filesystem::path& input,
                           const std::filesystem::path& object,
                           const std::filesystem::path& output);

// Scratch directory removed on destruction, whatever happened in between.
class TempArtifacts {
public:
    TempArtifacts();
    ~TempArtifacts();

    TempArtifacts(const TempArtifacts&) = delete;
    TempArtifacts& operator=(const TempArtifacts&) = delete;

    const std::filesystem::path& dir() const { return dir_; }
    std::filesystem::path input() const { return dir_ / "program.asm"; }
    std::filesystem::path object() const { return dir_ / "program.o"; }
    std::filesystem::path output() const { return dir_ / "program"; }

private:
    std::filesystem::path dir_;
};

class Toolchain {
public:
    using BinaryCallback = std::function<void(const std::filesystem::path& binary)>;

    explicit Toolchain(std::vector<std::string> commands = default_toolchain_commands());

    // Runs every command in order; the first non-zero exit aborts with
    // ToolchainFailure. on_binary sees the binary while it still exists.
    void build(const std::string& listing, const BinaryCallback& on_binary) const;

    const std::vector<std::string>& commands() const { return commands_; }

private:
    std::vector<std::string> commands_;

    static std::string run(const std::string& command, int& exit_code);
};

} // namespace asmlower
