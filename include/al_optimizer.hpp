#pragma once

#include "al_instruction.hpp"
#include <memory>
#include <string>
#include <vector>

namespace asmlower {

// Base class for all optimization passes. A pass is a pure transform over the
// finished instruction sequence of one function; its output must execute
// identically to its input.
class OptimizationPass {
public:
    virtual ~OptimizationPass() = default;
    virtual InstructionSequence run(const InstructionSequence& code) const = 0;
    virtual std::string name() const = 0;
};

// Removes stores to frame slots whose value is never read afterwards
// (overwritten first, or the function returns). Uses backward liveness over
// the function's control-flow graph.
class DeadStoreEliminationPass : public OptimizationPass {
public:
    InstructionSequence run(const InstructionSequence& code) const override;
    std::string name() const override { return "dead-store"; }
};

// Rewrites short instruction windows into shorter equivalents, repeated
// until nothing changes.
class PeepholePass : public OptimizationPass {
public:
    InstructionSequence run(const InstructionSequence& code) const override;
    std::string name() const override { return "peephole"; }

private:
    bool optimize_duplicate_mov(InstructionSequence& code, size_t i) const;
    bool optimize_store_reload(InstructionSequence& code, size_t i) const;
    bool optimize_self_mov(InstructionSequence& code, size_t i) const;
    bool optimize_jump_to_next(InstructionSequence& code, size_t i) const;
    bool optimize_unreachable_jump(InstructionSequence& code, size_t i) const;
};

struct PassStats {
    std::string pass;
    size_t removed{0};
};

// Ordered list of passes, each toggleable by name.
class OptimizationPipeline {
public:
    // dead-store, then peephole; both enabled.
    static OptimizationPipeline standard();

    void add_pass(std::unique_ptr<OptimizationPass> pass);

    // Returns false if no pass has that name.
    bool set_enabled(const std::string& name, bool enabled);
    bool is_enabled(const std::string& name) const;
    std::vector<std::string> pass_names() const;

    CompiledUnit run(const CompiledUnit& unit) const;
    Program run(const Program& program) const;

    // Instructions removed per pass by the last run over a whole program.
    const std::vector<PassStats>& stats() const { return stats_; }

private:
    struct Entry {
        std::unique_ptr<OptimizationPass> pass;
        bool enabled{true};
    };
    std::vector<Entry> passes_;
    mutable std::vector<PassStats> stats_;
};

} // namespace asmlower
