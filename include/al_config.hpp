// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file al_config.hpp
 * @brief Build configuration (asmlower.json) structure.
 *
 * Optimization toggles, toolchain command templates, worker count and
 * entry function for the asmlower driver.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace asmlower {

struct BuildConfig {
    bool dead_store = true;
    bool peephole = true;
    std::vector<std::string> toolchain_commands;  // empty: default_toolchain_commands()
    size_t jobs = 1;
    std::optional<std::string> entry;             // function the _start stub calls
};

// Fields absent from the document keep their current value in out; out is
// left untouched on failure.
bool ParseBuildConfig(const std::string& text, BuildConfig& out, std::string& err);
bool LoadBuildConfig(const std::filesystem::path& path, BuildConfig& out, std::string& err);

} // namespace asmlower
