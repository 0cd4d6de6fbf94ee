#include "al_optimizer.hpp"

namespace asmlower {

namespace {

bool is_mov(const Instruction& ins) {
    return ins.mnemonic == Mnemonic::MOV && ins.operands.size() == 2;
}

// Windows never extend past a label except at their first instruction.
bool removable(const InstructionSequence& code, size_t i) {
    return i < code.size() && !code[i].label && !code[i].is_label_only();
}

void remove_at(InstructionSequence& code, size_t i) {
    code.erase(code.begin() + static_cast<std::ptrdiff_t>(i));
}

} // anonymous namespace

InstructionSequence PeepholePass::run(const InstructionSequence& input) const {
    InstructionSequence code = input;

    bool changed = true;
    while (changed) {
        changed = false;
        for (size_t i = 0; i < code.size(); ++i) {
            if (optimize_self_mov(code, i) ||
                optimize_duplicate_mov(code, i) ||
                optimize_store_reload(code, i) ||
                optimize_jump_to_next(code, i) ||
                optimize_unreachable_jump(code, i)) {
                changed = true;
            }
        }
    }
    return code;
}

// mov rax, rax
bool PeepholePass::optimize_self_mov(InstructionSequence& code, size_t i) const {
    const Instruction& ins = code[i];
    if (!is_mov(ins) || !removable(code, i)) {
        return false;
    }
    if (ins.operands[0].kind == OperandKind::Register && ins.operands[0] == ins.operands[1]) {
        remove_at(code, i);
        return true;
    }
    return false;
}

// mov X, Y / mov X, Y  ->  mov X, Y
bool PeepholePass::optimize_duplicate_mov(InstructionSequence& code, size_t i) const {
    if (i + 1 >= code.size() || !is_mov(code[i]) || !is_mov(code[i + 1]) || !removable(code, i + 1)) {
        return false;
    }
    const Instruction& first = code[i];
    const Instruction& second = code[i + 1];
    if (first.operands[0] != second.operands[0] || first.operands[1] != second.operands[1]) {
        return false;
    }
    // mov rax, [rax+...] reads what it overwrites.
    const Operand& dst = first.operands[0];
    if (dst.kind == OperandKind::Register && first.operands[1].uses_reg(dst.reg)) {
        return false;
    }
    remove_at(code, i + 1);
    return true;
}

// mov M, R / mov R, M  ->  mov M, R   (and the load-then-store mirror)
bool PeepholePass::optimize_store_reload(InstructionSequence& code, size_t i) const {
    if (i + 1 >= code.size() || !is_mov(code[i]) || !is_mov(code[i + 1]) || !removable(code, i + 1)) {
        return false;
    }
    const Operand& a0 = code[i].operands[0];
    const Operand& a1 = code[i].operands[1];
    const Operand& b0 = code[i + 1].operands[0];
    const Operand& b1 = code[i + 1].operands[1];

    const bool store_reload = a0.kind == OperandKind::Memory && a1.kind == OperandKind::Register &&
                              b0 == a1 && b1 == a0 && !a0.uses_reg(a1.reg);
    const bool load_store = a0.kind == OperandKind::Register && a1.kind == OperandKind::Memory &&
                            b0 == a1 && b1 == a0 && !a1.uses_reg(a0.reg);
    if (store_reload || load_store) {
        remove_at(code, i + 1);
        return true;
    }
    return false;
}

// jmp L / L:  ->  L:
bool PeepholePass::optimize_jump_to_next(InstructionSequence& code, size_t i) const {
    const Instruction& ins = code[i];
    if (ins.mnemonic != Mnemonic::JMP || ins.label || ins.operands.empty() ||
        ins.operands[0].kind != OperandKind::Symbol) {
        return false;
    }
    const std::string& target = ins.operands[0].symbol;
    for (size_t k = i + 1; k < code.size() && code[k].label; ++k) {
        if (*code[k].label == target) {
            remove_at(code, i);
            return true;
        }
        if (!code[k].is_label_only()) {
            break;
        }
    }
    return false;
}

// ret / jmp L2  ->  ret   (the jump can never execute)
bool PeepholePass::optimize_unreachable_jump(InstructionSequence& code, size_t i) const {
    if (i + 1 >= code.size()) {
        return false;
    }
    const Mnemonic m = code[i].mnemonic;
    if (m != Mnemonic::RET && m != Mnemonic::JMP) {
        return false;
    }
    if (code[i + 1].mnemonic == Mnemonic::JMP && removable(code, i + 1)) {
        remove_at(code, i + 1);
        return true;
    }
    return false;
}

} // namespace asmlower
