// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file al_config.cpp
 * @brief Build configuration loader implementation.
 *
 * Implements LoadBuildConfig() to read asmlower.json with nlohmann/json
 * and validate every field's type.
 */

#include "al_config.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace asmlower {

using json = nlohmann::json;

static bool ReadAllText(const std::filesystem::path& p, std::string& out, std::string& err) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) { err = "cannot open: " + p.string(); return false; }
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return true;
}

static bool ReadFlag(const json& section, const char* key, bool& out, std::string& err) {
    auto it = section.find(key);
    if (it == section.end()) return true;
    if (!it->is_boolean()) {
        err = std::string("optimize.") + key + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool ParseBuildConfig(const std::string& text, BuildConfig& out, std::string& err) {
    BuildConfig cfg = out;
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!doc.is_object()) {
        err = "configuration must be a JSON object";
        return false;
    }

    if (auto it = doc.find("optimize"); it != doc.end()) {
        if (!it->is_object()) {
            err = "optimize must be an object";
            return false;
        }
        if (!ReadFlag(*it, "dead-store", cfg.dead_store, err)) return false;
        if (!ReadFlag(*it, "peephole", cfg.peephole, err)) return false;
    }

    if (auto it = doc.find("toolchain"); it != doc.end()) {
        if (!it->is_object()) {
            err = "toolchain must be an object";
            return false;
        }
        if (auto cmds = it->find("commands"); cmds != it->end()) {
            if (!cmds->is_array() || cmds->empty()) {
                err = "toolchain.commands must be a non-empty array of strings";
                return false;
            }
            std::vector<std::string> commands;
            for (const auto& c : *cmds) {
                if (!c.is_string()) {
                    err = "toolchain.commands must be a non-empty array of strings";
                    return false;
                }
                commands.push_back(c.get<std::string>());
            }
            cfg.toolchain_commands = std::move(commands);
        }
    }

    if (auto it = doc.find("jobs"); it != doc.end()) {
        if (!it->is_number_integer() || it->get<int64_t>() < 1) {
            err = "jobs must be a positive integer";
            return false;
        }
        cfg.jobs = static_cast<size_t>(it->get<int64_t>());
    }

    if (auto it = doc.find("entry"); it != doc.end()) {
        if (it->is_null()) {
            cfg.entry.reset();
        } else if (it->is_string() && !it->get<std::string>().empty()) {
            cfg.entry = it->get<std::string>();
        } else {
            err = "entry must be a function name";
            return false;
        }
    }

    out = std::move(cfg);
    return true;
}

bool LoadBuildConfig(const std::filesystem::path& path, BuildConfig& out, std::string& err) {
    std::string text;
    if (!ReadAllText(path, text, err)) return false;
    if (!ParseBuildConfig(text, out, err)) {
        err = path.string() + ": " + err;
        return false;
    }
    return true;
}

} // namespace asmlower
