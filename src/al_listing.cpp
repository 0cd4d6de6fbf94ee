#include "al_listing.hpp"
#include "al_context.hpp"
#include <set>
#include <sstream>
#include <stdexcept>

namespace asmlower {

std::string quote_bytes(const std::string& bytes) {
    std::ostringstream out;
    bool in_quotes = false;
    bool first = true;

    auto separate = [&]() {
        if (!first) {
            out << ", ";
        }
        first = false;
    };

    for (unsigned char c : bytes) {
        const bool printable = c >= 0x20 && c < 0x7f && c != '"';
        if (printable) {
            if (!in_quotes) {
                separate();
                out << '"';
                in_quotes = true;
            }
            out << c;
        } else {
            if (in_quotes) {
                out << '"';
                in_quotes = false;
            }
            separate();
            out << static_cast<int>(c);
        }
    }
    if (in_quotes) {
        out << '"';
    }
    separate();
    out << 0;
    return out.str();
}

void write_listing(const Program& program, std::ostream& out, const ListingOptions& options) {
    std::set<std::string> defined;
    std::set<std::string> externs;
    for (const auto& unit : program.units) {
        defined.insert(unit.function_name);
    }
    for (const auto& unit : program.units) {
        for (const auto& name : unit.externs) {
            if (!defined.count(name)) {
                externs.insert(name);
            }
        }
    }

    if (options.entry && !defined.count(*options.entry)) {
        throw std::runtime_error("Entry function '" + *options.entry + "' is not defined");
    }

    out << "bits 64\n";
    out << "default rel\n\n";
    out << "section .text\n";
    for (const auto& unit : program.units) {
        out << "global " << unit.function_name << "\n";
    }
    if (options.entry) {
        out << "global _start\n";
    }
    for (const auto& name : externs) {
        out << "extern " << name << "\n";
    }

    if (options.entry) {
        out << "\n_start:\n";
        out << "    call " << *options.entry << "\n";
        out << "    mov rdi, rax\n";
        out << "    mov rax, 60\n";
        out << "    syscall\n";
    }

    for (const auto& unit : program.units) {
        out << "\n";
        for (const auto& ins : unit.code) {
            out << ins.to_string() << "\n";
        }
    }

    bool has_strings = false;
    for (const auto& unit : program.units) {
        for (const auto& region : unit.data) {
            if (region.kind == DataRegion::Kind::String) {
                if (!has_strings) {
                    out << "\nsection .data\n";
                    has_strings = true;
                }
                out << region.symbol << ": db " << quote_bytes(region.bytes) << "\n";
            }
        }
    }

    out << "\nsection .bss\n";
    out << "alignb 8\n";
    for (const auto& name : program.globals) {
        out << global_symbol(name) << ": resq 1\n";
    }
    for (const auto& unit : program.units) {
        for (const auto& region : unit.data) {
            if (region.kind == DataRegion::Kind::Reserve) {
                out << region.symbol << ": resq " << region.quadwords << "\n";
            }
        }
    }
}

std::string render_listing(const Program& program, const ListingOptions& options) {
    std::ostringstream out;
    write_listing(program, out, options);
    return out.str();
}

} // namespace asmlower
