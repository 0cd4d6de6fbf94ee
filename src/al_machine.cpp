#include "al_machine.hpp"
#include "al_context.hpp"
#include <limits>

namespace asmlower {

namespace {

constexpr int64_t RETURN_SENTINEL = -1;

int64_t encode_return(size_t unit, size_t ip) {
    return static_cast<int64_t>((static_cast<uint64_t>(unit) << 32) | static_cast<uint64_t>(ip));
}

// Two's complement wrap-around, as the hardware does it.
int64_t wrap_add(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

int64_t wrap_sub(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

int64_t wrap_mul(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

} // anonymous namespace

Machine::Machine(const Program& program, MachineConfig config)
    : config_(config) {
    for (const auto& unit : program.units) {
        UnitInfo info;
        info.unit = &unit;
        for (size_t i = 0; i < unit.code.size(); ++i) {
            if (unit.code[i].label) {
                info.labels[*unit.code[i].label] = i;
            }
        }
        functions_[unit.function_name] = units_.size();
        units_.push_back(std::move(info));
    }

    for (const auto& name : program.globals) {
        place(global_symbol(name), 1);
    }
    for (const auto& unit : program.units) {
        for (const auto& region : unit.data) {
            if (region.kind == DataRegion::Kind::Reserve) {
                place(region.symbol, region.quadwords);
            } else {
                place(region.symbol, region.bytes.size() / 8 + 1);
                initial_strings_[region.symbol] = region.bytes;
            }
        }
    }

    reset();
}

void Machine::place(const std::string& symbol, size_t words) {
    if (symbols_.count(symbol)) {
        throw MachineFault("Duplicate data symbol '" + symbol + "'");
    }
    symbols_[symbol] = Layout{data_end_, words};
    data_end_ += 8 * static_cast<uint64_t>(words == 0 ? 1 : words);
}

void Machine::reset() {
    memory_.clear();
    for (const auto& [symbol, bytes] : initial_strings_) {
        write_string(symbols_.at(symbol).address, bytes);
    }
    regs_.fill(0);
    flag_lhs_ = flag_rhs_ = 0;
    steps_ = 0;
}

void Machine::write_string(uint64_t address, const std::string& bytes) {
    // Little-endian packing; the zero tail doubles as the terminator.
    for (size_t i = 0; i < bytes.size(); ++i) {
        const uint64_t word_addr = address + (i / 8) * 8;
        uint64_t word = static_cast<uint64_t>(memory_[word_addr]);
        word |= static_cast<uint64_t>(static_cast<unsigned char>(bytes[i])) << (8 * (i % 8));
        memory_[word_addr] = static_cast<int64_t>(word);
    }
}

uint64_t Machine::symbol_address(const std::string& symbol) const {
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        throw MachineFault("Unknown data symbol '" + symbol + "'");
    }
    return it->second.address;
}

int64_t Machine::read_word(uint64_t address) const {
    return load(address);
}

int64_t Machine::read_global(const std::string& name) const {
    return load(symbol_address(global_symbol(name)));
}

std::string Machine::read_string(uint64_t address) const {
    std::string out;
    for (uint64_t offset = 0;; ++offset) {
        const uint64_t byte_addr = address + offset;
        const uint64_t word = static_cast<uint64_t>(load(byte_addr & ~uint64_t{7}));
        const char c = static_cast<char>((word >> (8 * (byte_addr & 7))) & 0xff);
        if (c == '\0') {
            return out;
        }
        out += c;
    }
}

std::vector<int64_t> Machine::read_list(uint64_t address) const {
    const int64_t count = load(address);
    if (count < 0) {
        throw MachineFault("Negative list length at " + std::to_string(address));
    }
    std::vector<int64_t> out;
    out.reserve(static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i) {
        out.push_back(load(address + 8 * static_cast<uint64_t>(i + 1)));
    }
    return out;
}

std::unordered_map<std::string, std::vector<int64_t>> Machine::snapshot() const {
    std::unordered_map<std::string, std::vector<int64_t>> out;
    for (const auto& [symbol, layout] : symbols_) {
        std::vector<int64_t> words;
        words.reserve(layout.words);
        for (size_t i = 0; i < layout.words; ++i) {
            words.push_back(load(layout.address + 8 * i));
        }
        out.emplace(symbol, std::move(words));
    }
    return out;
}

// ---- Memory ----

void Machine::check_address(uint64_t address) const {
    if (address % 8 != 0) {
        fault("unaligned access at " + std::to_string(address));
    }
    const uint64_t stack_limit = STACK_TOP - 8 * static_cast<uint64_t>(config_.max_stack_words);
    const bool in_data = address >= DATA_BASE && address < data_end_;
    const bool in_stack = address >= stack_limit && address < STACK_TOP;
    if (!in_data && !in_stack) {
        fault("access to unmapped address " + std::to_string(address));
    }
}

int64_t Machine::load(uint64_t address) const {
    check_address(address);
    auto it = memory_.find(address);
    return it == memory_.end() ? 0 : it->second;
}

void Machine::store(uint64_t address, int64_t value) {
    check_address(address);
    memory_[address] = value;
}

void Machine::push(int64_t value) {
    reg_ref(Reg::RSP) = wrap_sub(reg(Reg::RSP), 8);
    if (static_cast<uint64_t>(reg(Reg::RSP)) < STACK_TOP - 8 * static_cast<uint64_t>(config_.max_stack_words)) {
        fault("stack overflow");
    }
    store(static_cast<uint64_t>(reg(Reg::RSP)), value);
}

int64_t Machine::pop() {
    const int64_t value = load(static_cast<uint64_t>(reg(Reg::RSP)));
    reg_ref(Reg::RSP) = wrap_add(reg(Reg::RSP), 8);
    return value;
}

// ---- Operands ----

uint64_t Machine::address_of(const Operand& op) const {
    switch (op.kind) {
        case OperandKind::Memory: {
            if (!op.symbol.empty()) {
                return symbol_address(op.symbol) + static_cast<uint64_t>(op.value);
            }
            uint64_t address = static_cast<uint64_t>(reg(op.reg));
            if (op.index != Reg::None) {
                address += 8 * static_cast<uint64_t>(reg(op.index));
            }
            return address + static_cast<uint64_t>(op.value);
        }
        case OperandKind::Symbol:
            return symbol_address(op.symbol);
        case OperandKind::Register:
        case OperandKind::Immediate:
            break;
    }
    fault("operand " + op.to_string() + " has no address");
}

int64_t Machine::read(const Operand& op) const {
    switch (op.kind) {
        case OperandKind::Register:
            return reg(op.reg);
        case OperandKind::Immediate:
            return op.value;
        case OperandKind::Memory:
            return load(address_of(op));
        case OperandKind::Symbol:
            return static_cast<int64_t>(symbol_address(op.symbol));
    }
    return 0;
}

void Machine::write(const Operand& op, int64_t value) {
    switch (op.kind) {
        case OperandKind::Register:
            reg_ref(op.reg) = value;
            return;
        case OperandKind::Memory:
            store(address_of(op), value);
            return;
        case OperandKind::Immediate:
        case OperandKind::Symbol:
            break;
    }
    fault("cannot write to " + op.to_string());
}

// ---- Execution ----

bool Machine::condition_holds(Mnemonic m) const {
    switch (m) {
        case Mnemonic::JZ:
        case Mnemonic::JE:  return flag_lhs_ == flag_rhs_;
        case Mnemonic::JNE: return flag_lhs_ != flag_rhs_;
        case Mnemonic::JG:  return flag_lhs_ > flag_rhs_;
        case Mnemonic::JL:  return flag_lhs_ < flag_rhs_;
        case Mnemonic::JGE: return flag_lhs_ >= flag_rhs_;
        case Mnemonic::JLE: return flag_lhs_ <= flag_rhs_;
        default:            return false;
    }
}

void Machine::jump(const std::string& label) {
    const auto& labels = units_[unit_].labels;
    auto it = labels.find(label);
    if (it == labels.end()) {
        fault("jump to unknown label '" + label + "'");
    }
    ip_ = it->second;
}

int64_t Machine::call(const std::string& function, const std::vector<int64_t>& args) {
    auto it = functions_.find(function);
    if (it == functions_.end()) {
        throw MachineFault("No function named '" + function + "'");
    }

    regs_.fill(0);
    reg_ref(Reg::RSP) = static_cast<int64_t>(STACK_TOP);
    for (int64_t arg : args) {
        push(arg);
    }
    push(RETURN_SENTINEL);

    unit_ = it->second;
    ip_ = 0;
    halted_ = false;

    while (!halted_) {
        const auto& code = units_[unit_].unit->code;
        if (ip_ >= code.size()) {
            fault("execution ran past the end of the function");
        }
        if (++steps_ > config_.max_steps) {
            fault("step limit of " + std::to_string(config_.max_steps) + " exceeded");
        }
        const Instruction& ins = code[ip_++];
        execute(ins);
    }
    return reg(Reg::RAX);
}

void Machine::execute(const Instruction& ins) {
    const auto& ops = ins.operands;
    auto expect = [&](size_t n) {
        if (ops.size() != n) {
            fault(std::string(mnemonic_name(ins.mnemonic)) + " expects " + std::to_string(n) + " operands");
        }
    };

    switch (ins.mnemonic) {
        case Mnemonic::None:
            return;

        case Mnemonic::MOV:
            expect(2);
            write(ops[0], read(ops[1]));
            return;
        case Mnemonic::LEA:
            expect(2);
            write(ops[0], static_cast<int64_t>(address_of(ops[1])));
            return;
        case Mnemonic::XCHG: {
            expect(2);
            const int64_t a = read(ops[0]);
            const int64_t b = read(ops[1]);
            write(ops[0], b);
            write(ops[1], a);
            return;
        }
        case Mnemonic::PUSH:
            expect(1);
            push(read(ops[0]));
            return;
        case Mnemonic::POP:
            expect(1);
            write(ops[0], pop());
            return;

        case Mnemonic::ADD:
            expect(2);
            write(ops[0], wrap_add(read(ops[0]), read(ops[1])));
            return;
        case Mnemonic::SUB:
            expect(2);
            write(ops[0], wrap_sub(read(ops[0]), read(ops[1])));
            return;
        case Mnemonic::IMUL:
            expect(2);
            write(ops[0], wrap_mul(read(ops[0]), read(ops[1])));
            return;
        case Mnemonic::CQO:
            reg_ref(Reg::RDX) = reg(Reg::RAX) < 0 ? -1 : 0;
            return;
        case Mnemonic::IDIV: {
            expect(1);
            const int64_t divisor = read(ops[0]);
            const int64_t dividend = reg(Reg::RAX);
            if (divisor == 0) {
                fault("division by zero");
            }
            if (reg(Reg::RDX) != (dividend < 0 ? -1 : 0)) {
                fault("dividend does not fit in rax");
            }
            if (dividend == std::numeric_limits<int64_t>::min() && divisor == -1) {
                fault("division overflow");
            }
            reg_ref(Reg::RAX) = dividend / divisor;
            reg_ref(Reg::RDX) = dividend % divisor;
            return;
        }

        case Mnemonic::CMP:
            expect(2);
            flag_lhs_ = read(ops[0]);
            flag_rhs_ = read(ops[1]);
            return;
        case Mnemonic::TEST:
            expect(2);
            flag_lhs_ = read(ops[0]) & read(ops[1]);
            flag_rhs_ = 0;
            return;

        case Mnemonic::JMP:
            expect(1);
            jump(ops[0].symbol);
            return;
        case Mnemonic::JZ:
        case Mnemonic::JE:
        case Mnemonic::JNE:
        case Mnemonic::JG:
        case Mnemonic::JL:
        case Mnemonic::JGE:
        case Mnemonic::JLE:
            expect(1);
            if (condition_holds(ins.mnemonic)) {
                jump(ops[0].symbol);
            }
            return;

        case Mnemonic::CALL: {
            expect(1);
            auto it = functions_.find(ops[0].symbol);
            if (it == functions_.end()) {
                fault("call to external symbol '" + ops[0].symbol + "'");
            }
            push(encode_return(unit_, ip_));
            unit_ = it->second;
            ip_ = 0;
            return;
        }
        case Mnemonic::RET: {
            const int64_t target = pop();
            if (target == RETURN_SENTINEL) {
                halted_ = true;
                return;
            }
            const uint64_t encoded = static_cast<uint64_t>(target);
            const size_t unit = static_cast<size_t>(encoded >> 32);
            if (unit >= units_.size()) {
                fault("return to corrupted address " + std::to_string(target));
            }
            unit_ = unit;
            ip_ = static_cast<size_t>(encoded & 0xffffffffu);
            return;
        }
    }
}

void Machine::fault(const std::string& msg) const {
    std::string where;
    if (unit_ < units_.size()) {
        where = " in " + units_[unit_].unit->function_name + " at #" + std::to_string(ip_ == 0 ? 0 : ip_ - 1);
    }
    throw MachineFault("Machine fault" + where + ": " + msg);
}

} // namespace asmlower
