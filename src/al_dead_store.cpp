#include "al_optimizer.hpp"
#include <set>
#include <unordered_map>

namespace asmlower {

namespace {

using SlotSet = std::set<int64_t>;

struct SlotUse {
    SlotSet reads;
    bool reads_all{false};         // rbp-based indexed access
    std::optional<int64_t> write;  // mov <slot>, ...
};

SlotUse analyze(const Instruction& ins) {
    SlotUse use;
    for (size_t i = 0; i < ins.operands.size(); ++i) {
        const Operand& op = ins.operands[i];
        if (op.kind != OperandKind::Memory || op.reg != Reg::RBP || !op.symbol.empty()) {
            continue;
        }
        if (op.index != Reg::None) {
            use.reads_all = true;
            continue;
        }
        if (ins.mnemonic == Mnemonic::MOV && i == 0) {
            use.write = op.value;
        } else {
            use.reads.insert(op.value);
        }
    }
    return use;
}

std::vector<std::vector<size_t>> successors(const InstructionSequence& code) {
    std::unordered_map<std::string, size_t> labels;
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i].label) {
            labels[*code[i].label] = i;
        }
    }

    auto target_of = [&](const Instruction& ins) -> std::optional<size_t> {
        if (ins.operands.empty() || ins.operands[0].kind != OperandKind::Symbol) {
            return std::nullopt;
        }
        auto it = labels.find(ins.operands[0].symbol);
        if (it == labels.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    std::vector<std::vector<size_t>> succ(code.size());
    for (size_t i = 0; i < code.size(); ++i) {
        const Instruction& ins = code[i];
        if (ins.mnemonic == Mnemonic::RET) {
            continue;
        }
        if (ins.mnemonic == Mnemonic::JMP || is_conditional_jump(ins.mnemonic)) {
            if (auto target = target_of(ins)) {
                succ[i].push_back(*target);
            }
            if (ins.mnemonic == Mnemonic::JMP) {
                continue;
            }
        }
        if (i + 1 < code.size()) {
            succ[i].push_back(i + 1);
        }
    }
    return succ;
}

} // anonymous namespace

InstructionSequence DeadStoreEliminationPass::run(const InstructionSequence& code) const {
    const size_t n = code.size();
    if (n == 0) {
        return code;
    }

    std::vector<SlotUse> uses;
    uses.reserve(n);
    SlotSet all_slots;
    for (const auto& ins : code) {
        uses.push_back(analyze(ins));
        all_slots.insert(uses.back().reads.begin(), uses.back().reads.end());
        if (uses.back().write) {
            all_slots.insert(*uses.back().write);
        }
    }

    const auto succ = successors(code);
    std::vector<SlotSet> live_in(n);
    std::vector<SlotSet> live_out(n);

    // Frame slots die when the function returns, so nothing is live at a ret.
    bool changed = true;
    while (changed) {
        changed = false;
        for (size_t k = n; k-- > 0;) {
            SlotSet out;
            for (size_t s : succ[k]) {
                out.insert(live_in[s].begin(), live_in[s].end());
            }

            SlotSet in = out;
            if (uses[k].write) {
                in.erase(*uses[k].write);
            }
            if (uses[k].reads_all) {
                in.insert(all_slots.begin(), all_slots.end());
            }
            in.insert(uses[k].reads.begin(), uses[k].reads.end());

            if (in != live_in[k] || out != live_out[k]) {
                live_in[k] = std::move(in);
                live_out[k] = std::move(out);
                changed = true;
            }
        }
    }

    InstructionSequence result;
    result.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const auto& write = uses[i].write;
        const bool dead = write && !code[i].label && live_out[i].count(*write) == 0 &&
                          uses[i].reads.empty() && !uses[i].reads_all;
        if (!dead) {
            result.push_back(code[i]);
        }
    }
    return result;
}

} // namespace asmlower
