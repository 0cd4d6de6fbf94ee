#pragma once

#include "al_instruction.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace asmlower {

struct ListingOptions {
    // When set, a _start stub calls this function and exits with its result.
    std::optional<std::string> entry;
};

// Renders a whole program as NASM source: text section with global/extern
// declarations, then string data, then zero-initialized storage for globals
// and aggregate regions.
void write_listing(const Program& program, std::ostream& out, const ListingOptions& options = {});
std::string render_listing(const Program& program, const ListingOptions& options = {});

// NASM operand for a byte string, e.g. `"ab", 10, "c", 0`.
std::string quote_bytes(const std::string& bytes);

} // namespace asmlower
