#include "al_optimizer.hpp"

namespace asmlower {

OptimizationPipeline OptimizationPipeline::standard() {
    OptimizationPipeline pipeline;
    pipeline.add_pass(std::make_unique<DeadStoreEliminationPass>());
    pipeline.add_pass(std::make_unique<PeepholePass>());
    return pipeline;
}

void OptimizationPipeline::add_pass(std::unique_ptr<OptimizationPass> pass) {
    passes_.push_back(Entry{std::move(pass), true});
}

bool OptimizationPipeline::set_enabled(const std::string& name, bool enabled) {
    for (auto& entry : passes_) {
        if (entry.pass->name() == name) {
            entry.enabled = enabled;
            return true;
        }
    }
    return false;
}

bool OptimizationPipeline::is_enabled(const std::string& name) const {
    for (const auto& entry : passes_) {
        if (entry.pass->name() == name) {
            return entry.enabled;
        }
    }
    return false;
}

std::vector<std::string> OptimizationPipeline::pass_names() const {
    std::vector<std::string> names;
    names.reserve(passes_.size());
    for (const auto& entry : passes_) {
        names.push_back(entry.pass->name());
    }
    return names;
}

CompiledUnit OptimizationPipeline::run(const CompiledUnit& unit) const {
    CompiledUnit out = unit;
    for (const auto& entry : passes_) {
        if (entry.enabled) {
            out.code = entry.pass->run(out.code);
        }
    }
    return out;
}

Program OptimizationPipeline::run(const Program& program) const {
    stats_.clear();
    for (const auto& entry : passes_) {
        stats_.push_back(PassStats{entry.pass->name(), 0});
    }

    Program out;
    out.globals = program.globals;
    out.units.reserve(program.units.size());
    for (const auto& unit : program.units) {
        CompiledUnit optimized = unit;
        for (size_t p = 0; p < passes_.size(); ++p) {
            if (!passes_[p].enabled) {
                continue;
            }
            const size_t before = optimized.code.size();
            optimized.code = passes_[p].pass->run(optimized.code);
            stats_[p].removed += before - optimized.code.size();
        }
        out.units.push_back(std::move(optimized));
    }
    return out;
}

} // namespace asmlower
