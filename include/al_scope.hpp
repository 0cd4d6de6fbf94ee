#pragma once

#include "al_context.hpp"
#include "al_instruction.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace asmlower {

enum class NameClass {
    BuiltinConstant,
    Local,
    Global,
};

const char* name_class_name(NameClass cls);

// Value of True/False/None, or nullopt for any other identifier.
std::optional<int64_t> builtin_constant_value(const std::string& name);

// Local set of the function currently being lowered. Created fresh for each
// function and discarded afterwards.
class Scope {
public:
    explicit Scope(std::string owner) : owner_(std::move(owner)) {}

    const std::string& owner() const { return owner_; }

    // Parameters live in the caller's argument area above the saved rbp.
    void declare_param(const std::string& name, size_t index, size_t count);

    // Inserts name into the local set if absent; returns its frame slot.
    Operand declare_local(const std::string& name);

    bool contains(const std::string& name) const { return slots_.count(name) != 0; }
    Operand slot(const std::string& name) const;

    size_t local_count() const { return order_.size(); }
    size_t frame_slots() const { return frame_slots_; }
    const std::vector<std::string>& locals() const { return order_; }

private:
    std::string owner_;
    std::unordered_map<std::string, Operand> slots_;
    std::vector<std::string> order_;
    size_t frame_slots_{0};
};

struct Resolution {
    NameClass name_class{NameClass::Global};
    int64_t builtin_value{0};  // BuiltinConstant
    Operand storage;           // Local or Global
};

// builtin -> local -> global -> auto-promote to global.
Resolution resolve_name(const std::string& name, const Scope& scope, CompilationContext& ctx);

} // namespace asmlower
