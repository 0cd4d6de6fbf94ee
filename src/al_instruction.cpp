#include "al_instruction.hpp"
#include <sstream>
#include <stdexcept>

namespace asmlower {

const char* reg_name(Reg reg) {
    switch (reg) {
        case Reg::None: return "";
        case Reg::RAX:  return "rax";
        case Reg::RBX:  return "rbx";
        case Reg::RCX:  return "rcx";
        case Reg::RDX:  return "rdx";
        case Reg::RBP:  return "rbp";
        case Reg::RSP:  return "rsp";
    }
    return "";
}

const char* mnemonic_name(Mnemonic m) {
    switch (m) {
        case Mnemonic::None: return "";
        case Mnemonic::MOV:  return "mov";
        case Mnemonic::LEA:  return "lea";
        case Mnemonic::XCHG: return "xchg";
        case Mnemonic::PUSH: return "push";
        case Mnemonic::POP:  return "pop";
        case Mnemonic::ADD:  return "add";
        case Mnemonic::SUB:  return "sub";
        case Mnemonic::IMUL: return "imul";
        case Mnemonic::CQO:  return "cqo";
        case Mnemonic::IDIV: return "idiv";
        case Mnemonic::CMP:  return "cmp";
        case Mnemonic::TEST: return "test";
        case Mnemonic::JMP:  return "jmp";
        case Mnemonic::JZ:   return "jz";
        case Mnemonic::JE:   return "je";
        case Mnemonic::JNE:  return "jne";
        case Mnemonic::JG:   return "jg";
        case Mnemonic::JL:   return "jl";
        case Mnemonic::JGE:  return "jge";
        case Mnemonic::JLE:  return "jle";
        case Mnemonic::CALL: return "call";
        case Mnemonic::RET:  return "ret";
    }
    return "";
}

bool is_conditional_jump(Mnemonic m) {
    switch (m) {
        case Mnemonic::JZ:
        case Mnemonic::JE:
        case Mnemonic::JNE:
        case Mnemonic::JG:
        case Mnemonic::JL:
        case Mnemonic::JGE:
        case Mnemonic::JLE:
            return true;
        default:
            return false;
    }
}

Operand Operand::make_reg(Reg r) {
    Operand op;
    op.kind = OperandKind::Register;
    op.reg = r;
    return op;
}

Operand Operand::make_imm(int64_t v) {
    Operand op;
    op.kind = OperandKind::Immediate;
    op.value = v;
    return op;
}

Operand Operand::make_symbol(std::string name) {
    Operand op;
    op.kind = OperandKind::Symbol;
    op.symbol = std::move(name);
    return op;
}

Operand Operand::frame_slot(int64_t displacement) {
    Operand op;
    op.kind = OperandKind::Memory;
    op.reg = Reg::RBP;
    op.value = displacement;
    return op;
}

Operand Operand::global(std::string symbol_name, int64_t displacement) {
    Operand op;
    op.kind = OperandKind::Memory;
    op.symbol = std::move(symbol_name);
    op.value = displacement;
    return op;
}

Operand Operand::element(Reg base, Reg index_reg, int64_t displacement) {
    Operand op;
    op.kind = OperandKind::Memory;
    op.reg = base;
    op.index = index_reg;
    op.value = displacement;
    return op;
}

bool Operand::uses_reg(Reg r) const {
    switch (kind) {
        case OperandKind::Register:
            return reg == r;
        case OperandKind::Memory:
            return reg == r || index == r;
        case OperandKind::Immediate:
        case OperandKind::Symbol:
            return false;
    }
    return false;
}

std::string Operand::to_string() const {
    std::ostringstream out;
    switch (kind) {
        case OperandKind::Register:
            out << reg_name(reg);
            break;
        case OperandKind::Immediate:
            out << value;
            break;
        case OperandKind::Symbol:
            out << symbol;
            break;
        case OperandKind::Memory:
            out << "qword [";
            if (!symbol.empty()) {
                out << "rel " << symbol;
            } else {
                out << reg_name(reg);
                if (index != Reg::None) {
                    out << "+" << reg_name(index) << "*8";
                }
            }
            if (value > 0) {
                out << "+" << value;
            } else if (value < 0) {
                out << value;
            }
            out << "]";
            break;
    }
    return out.str();
}

std::string Instruction::to_string() const {
    std::ostringstream out;
    if (label) {
        out << *label << ":";
        if (mnemonic != Mnemonic::None) {
            out << "\n";
        }
    }
    if (mnemonic != Mnemonic::None) {
        out << "    " << mnemonic_name(mnemonic);
        for (size_t i = 0; i < operands.size(); ++i) {
            out << (i == 0 ? " " : ", ");
            // lea takes the address of a data symbol
            if (mnemonic == Mnemonic::LEA && operands[i].kind == OperandKind::Symbol) {
                out << "[rel " << operands[i].symbol << "]";
            } else {
                out << operands[i].to_string();
            }
        }
    }
    return out.str();
}

void CompiledUnit::patch_reserve(size_t offset, size_t slots) {
    if (offset >= code.size() || code[offset].mnemonic != Mnemonic::SUB) {
        throw std::runtime_error("Frame reservation not found at offset " + std::to_string(offset));
    }
    if (slots == 0) {
        code.erase(code.begin() + static_cast<std::ptrdiff_t>(offset));
        return;
    }
    code[offset].operands[1] = Operand::make_imm(static_cast<int64_t>(slots * 8));
}

} // namespace asmlower
