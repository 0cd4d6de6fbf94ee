#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace asmlower {

// Compilation-wide set of global identifiers. Insertion is serialized so
// functions can be lowered on several workers at once.
class GlobalScope {
public:
    bool contains(const std::string& name) const;

    // Returns true if the name was not yet global.
    bool promote(const std::string& name);

    std::vector<std::string> names() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> names_;
};

// State shared by every lowering call of one compilation: the label counter,
// the global scope and the names of the functions being compiled.
class CompilationContext {
public:
    CompilationContext() = default;
    CompilationContext(const CompilationContext&) = delete;
    CompilationContext& operator=(const CompilationContext&) = delete;

    // Monotonic for the whole compilation, never reset per function.
    uint64_t next_label_id() { return label_counter_.fetch_add(1, std::memory_order_relaxed); }

    std::string fresh_label(const std::string& prefix) {
        return prefix + "_" + std::to_string(next_label_id());
    }

    GlobalScope& globals() { return globals_; }
    const GlobalScope& globals() const { return globals_; }

    // Function names are registered before any worker starts and are
    // read-only afterwards. Returns false for a duplicate name.
    bool declare_function(const std::string& name, size_t arity) {
        return functions_.emplace(name, arity).second;
    }
    bool is_function(const std::string& name) const { return functions_.count(name) != 0; }
    size_t arity(const std::string& name) const { return functions_.at(name); }

private:
    std::atomic<uint64_t> label_counter_{0};
    GlobalScope globals_;
    std::unordered_map<std::string, size_t> functions_;
};

std::string global_symbol(const std::string& name);

} // namespace asmlower
