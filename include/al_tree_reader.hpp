#pragma once

#include "al_ast.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace asmlower {

// The input document is not a well-formed tree: invalid JSON, a missing
// field or a field of the wrong type. path() locates the offending node.
class TreeFormatError : public std::runtime_error {
public:
    TreeFormatError(const std::string& msg, std::string path)
        : std::runtime_error(path.empty() ? msg : msg + " at " + path)
        , path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Builds a Module from the parser's JSON document `{"body": [...]}`.
// Unknown node kinds, top-level statements and float constants raise
// UnsupportedConstruct.
Module read_tree(const nlohmann::json& document);
Module parse_tree(const std::string& text);
Module load_tree(const std::filesystem::path& path);

} // namespace asmlower
