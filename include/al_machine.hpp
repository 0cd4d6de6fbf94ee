#pragma once

#include "al_instruction.hpp"
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace asmlower {

// The lowered program did something the hardware would trap on, or the
// simulation hit its step or stack limit.
class MachineFault : public std::runtime_error {
public:
    explicit MachineFault(const std::string& msg) : std::runtime_error(msg) {}
};

struct MachineConfig {
    size_t max_steps = 10'000'000;
    size_t max_stack_words = 1 << 16;
};

// Executes CompiledUnits instruction by instruction with the semantics the
// emitted NASM has on x86-64. Globals, aggregate regions and strings are laid
// out from DATA_BASE; memory persists across call()s.
// The program must outlive the machine.
class Machine {
public:
    static constexpr uint64_t DATA_BASE = 0x1000;
    static constexpr uint64_t STACK_TOP = 0x7fff0000;

    explicit Machine(const Program& program, MachineConfig config = MachineConfig{});

    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // Pushes args left to right and calls the function. Returns rax.
    int64_t call(const std::string& function, const std::vector<int64_t>& args = {});

    // Memory inspection
    bool has_symbol(const std::string& symbol) const { return symbols_.count(symbol) != 0; }
    uint64_t symbol_address(const std::string& symbol) const;
    int64_t read_word(uint64_t address) const;
    int64_t read_global(const std::string& name) const;
    std::string read_string(uint64_t address) const;

    // Length-prefixed list at address: the elements.
    std::vector<int64_t> read_list(uint64_t address) const;

    // Every data word, keyed by symbol, for comparing two runs.
    std::unordered_map<std::string, std::vector<int64_t>> snapshot() const;

    // Zeroes data memory.
    void reset();

    size_t steps() const { return steps_; }
    int64_t reg(Reg r) const { return regs_[static_cast<size_t>(r)]; }

private:
    struct Layout {
        uint64_t address;
        size_t words;
    };

    struct UnitInfo {
        const CompiledUnit* unit;
        std::unordered_map<std::string, size_t> labels;
    };

    MachineConfig config_;
    std::vector<UnitInfo> units_;
    std::unordered_map<std::string, size_t> functions_;
    std::unordered_map<std::string, Layout> symbols_;
    std::unordered_map<std::string, std::string> initial_strings_;
    uint64_t data_end_{DATA_BASE};

    std::unordered_map<uint64_t, int64_t> memory_;
    std::array<int64_t, 7> regs_{};
    int64_t flag_lhs_{0};
    int64_t flag_rhs_{0};

    size_t unit_{0};
    size_t ip_{0};
    size_t steps_{0};
    bool halted_{false};

    void place(const std::string& symbol, size_t words);
    void write_string(uint64_t address, const std::string& bytes);

    void check_address(uint64_t address) const;
    int64_t load(uint64_t address) const;
    void store(uint64_t address, int64_t value);
    void push(int64_t value);
    int64_t pop();

    uint64_t address_of(const Operand& op) const;
    int64_t read(const Operand& op) const;
    void write(const Operand& op, int64_t value);
    int64_t& reg_ref(Reg r) { return regs_[static_cast<size_t>(r)]; }

    bool condition_holds(Mnemonic m) const;
    void jump(const std::string& label);
    void execute(const Instruction& ins);

    [[noreturn]] void fault(const std::string& msg) const;
};

} // namespace asmlower
