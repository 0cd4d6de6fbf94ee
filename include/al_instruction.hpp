#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace asmlower {

// Registers used by the accumulator convention.
enum class Reg : uint8_t {
    None,
    RAX,  // accumulator
    RBX,  // scratch (left operand)
    RCX,  // element index for aggregate stores
    RDX,  // remainder of idiv
    RBP,
    RSP,
};

const char* reg_name(Reg reg);

enum class Mnemonic : uint8_t {
    None,  // bare label line

    // Data movement
    MOV,
    LEA,
    XCHG,
    PUSH,
    POP,

    // Arithmetic
    ADD,
    SUB,
    IMUL,
    CQO,
    IDIV,

    // Comparison
    CMP,
    TEST,

    // Control flow
    JMP,
    JZ,
    JE,
    JNE,
    JG,
    JL,
    JGE,
    JLE,
    CALL,
    RET,
};

const char* mnemonic_name(Mnemonic m);
bool is_conditional_jump(Mnemonic m);

enum class OperandKind : uint8_t {
    Register,   // rax
    Immediate,  // 42
    Memory,     // [rbp-8], qword [rel g_x], [rbx+rcx*8+8]
    Symbol,     // jump/call target or data symbol address
};

struct Operand {
    OperandKind kind{OperandKind::Immediate};
    Reg reg{Reg::None};       // Register, or Memory base
    Reg index{Reg::None};     // Memory index register (scale is always 8)
    int64_t value{0};         // Immediate, or Memory displacement
    std::string symbol;       // Symbol, or rip-relative Memory symbol

    static Operand make_reg(Reg r);
    static Operand make_imm(int64_t v);
    static Operand make_symbol(std::string name);
    static Operand frame_slot(int64_t displacement);
    static Operand global(std::string symbol_name, int64_t displacement = 0);
    static Operand element(Reg base, Reg index_reg, int64_t displacement);

    bool is_reg(Reg r) const { return kind == OperandKind::Register && reg == r; }
    bool is_frame_slot() const {
        return kind == OperandKind::Memory && reg == Reg::RBP && index == Reg::None && symbol.empty();
    }
    bool uses_reg(Reg r) const;

    std::string to_string() const;

    bool operator==(const Operand& other) const {
        return kind == other.kind && reg == other.reg && index == other.index &&
               value == other.value && symbol == other.symbol;
    }
    bool operator!=(const Operand& other) const { return !(*this == other); }
};

struct Instruction {
    Mnemonic mnemonic{Mnemonic::None};
    std::vector<Operand> operands;
    std::optional<std::string> label;  // emitted as "label:" before the instruction
    uint32_t line{0};

    bool is_label_only() const { return mnemonic == Mnemonic::None; }
    std::string to_string() const;
};

using InstructionSequence = std::vector<Instruction>;

// Static storage a function introduced: aggregate regions and string data.
struct DataRegion {
    enum class Kind { Reserve, String };

    Kind kind{Kind::Reserve};
    std::string symbol;
    size_t quadwords{0};   // Reserve
    std::string bytes;     // String, without terminator
};

// Finished instruction sequence for one function, ready for text emission.
struct CompiledUnit {
    std::string function_name;
    size_t param_count{0};
    size_t local_count{0};   // identifiers in the function's local set
    size_t frame_slots{0};   // quadwords reserved below rbp
    InstructionSequence code;
    std::vector<DataRegion> data;
    std::set<std::string> externs;

    void write(Mnemonic m, std::vector<Operand> operands, uint32_t line) {
        Instruction ins;
        ins.mnemonic = m;
        ins.operands = std::move(operands);
        ins.line = line;
        code.push_back(std::move(ins));
    }

    void write_label(const std::string& name, uint32_t line) {
        Instruction ins;
        ins.label = name;
        ins.line = line;
        code.push_back(std::move(ins));
    }

    // Placeholder whose immediate is filled in once the body is lowered.
    size_t emit_reserve(uint32_t line) {
        write(Mnemonic::SUB, {Operand::make_reg(Reg::RSP), Operand::make_imm(0)}, line);
        return code.size() - 1;
    }

    void patch_reserve(size_t offset, size_t slots);
};

// Everything one compilation produced, in source order.
struct Program {
    std::vector<CompiledUnit> units;
    std::vector<std::string> globals;  // identifiers, see global_symbol()

    const CompiledUnit* find_unit(const std::string& name) const {
        for (const auto& unit : units) {
            if (unit.function_name == name) {
                return &unit;
            }
        }
        return nullptr;
    }
};

} // namespace asmlower
