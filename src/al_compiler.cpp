#include "al_compiler.hpp"
#include "al_core.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace asmlower {

bool is_reserved_symbol(const std::string& name) {
    static const char* const numbered[] = {
        "else_", "end_", "loop_", "true_", "false_", "list_", "dict_", "str_",
    };
    if (name == "_start" || name.rfind("g_", 0) == 0) {
        return true;
    }
    for (const char* prefix : numbered) {
        const std::string p(prefix);
        if (name.size() > p.size() && name.compare(0, p.size(), p) == 0 &&
            name.find_first_not_of("0123456789", p.size()) == std::string::npos) {
            return true;
        }
    }
    return false;
}

Program Compiler::compile(const Module& module, size_t jobs) {
    for (const auto& fn : module.functions) {
        if (!fn) {
            throw CompilerError("Null function in module");
        }
        if (is_reserved_symbol(fn->name)) {
            throw CompilerError("Function name '" + fn->name + "' clashes with generated symbols", fn->line);
        }
        if (!ctx_.declare_function(fn->name, fn->params.size())) {
            throw CompilerError("Duplicate function '" + fn->name + "'", fn->line);
        }
    }

    const size_t count = module.functions.size();
    Program program;
    program.units.resize(count);

    if (jobs <= 1 || count <= 1) {
        for (size_t i = 0; i < count; ++i) {
            Compiler function_compiler(ctx_);
            program.units[i] = function_compiler.compile_function(*module.functions[i]);
        }
    } else {
        std::vector<std::exception_ptr> errors(count);
        std::atomic<size_t> next{0};
        auto worker = [&]() {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                try {
                    Compiler function_compiler(ctx_);
                    program.units[i] = function_compiler.compile_function(*module.functions[i]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }
        };

        std::vector<std::thread> workers;
        const size_t thread_count = std::min(jobs, count);
        workers.reserve(thread_count);
        for (size_t t = 0; t < thread_count; ++t) {
            workers.emplace_back(worker);
        }
        for (auto& w : workers) {
            w.join();
        }

        // The earliest failing function in source order wins; nothing partial
        // is returned.
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    program.globals = ctx_.globals().names();
    return program;
}

CompiledUnit Compiler::compile_function(const FunctionDef& fn) {
    unit_ = CompiledUnit{};
    unit_.function_name = fn.name;
    unit_.param_count = fn.params.size();
    scope_.emplace(fn.name);
    path_.clear();
    recursion_depth_ = 0;

    PathGuard root(*this, fn.name);

    for (size_t i = 0; i < fn.params.size(); ++i) {
        scope_->declare_param(fn.params[i], i, fn.params.size());
    }

    emit_label(fn.name, fn.line);
    emit(Mnemonic::PUSH, {Operand::make_reg(Reg::RBP)}, fn.line);
    emit(Mnemonic::MOV, {Operand::make_reg(Reg::RBP), Operand::make_reg(Reg::RSP)}, fn.line);
    size_t reserve = unit_.emit_reserve(fn.line);

    compile_block(fn.body, "body");

    // Fallthrough exit, emitted even after a trailing return.
    emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(0)}, fn.line);
    emit_epilogue(fn.line);

    unit_.patch_reserve(reserve, scope_->frame_slots());
    unit_.local_count = scope_->local_count();
    unit_.frame_slots = scope_->frame_slots();

    AL_DEBUG_LOWER("%s: %zu instructions, %zu locals", fn.name.c_str(),
                   unit_.code.size(), unit_.local_count);

    scope_.reset();
    return std::move(unit_);
}

void Compiler::compile_block(const NodeList& body, const char* field) {
    for (size_t i = 0; i < body.size(); ++i) {
        PathGuard guard(*this, std::string(field) + "[" + std::to_string(i) + "]");
        compile_stmt(body[i].get());
    }
}

void Compiler::compile_stmt(const Node* node) {
    if (!node) {
        throw CompilerError("Null statement at " + path_string());
    }

    RecursionGuard guard(*this);

    switch (node->kind) {
        case NodeKind::Assign:
            visit(static_cast<const AssignNode*>(node));
            return;
        case NodeKind::AugAssign:
            visit(static_cast<const AugAssignNode*>(node));
            return;
        case NodeKind::Return:
            visit(static_cast<const ReturnNode*>(node));
            return;
        case NodeKind::ExprStatement:
            visit(static_cast<const ExprStatementNode*>(node));
            return;
        case NodeKind::If:
            visit(static_cast<const IfNode*>(node));
            return;
        case NodeKind::While:
            visit(static_cast<const WhileNode*>(node));
            return;
        case NodeKind::FunctionDef:
            unsupported(node, "nested function definitions are not supported");
        case NodeKind::BinaryOp:
        case NodeKind::Compare:
        case NodeKind::Call:
        case NodeKind::ListLiteral:
        case NodeKind::DictLiteral:
        case NodeKind::Subscript:
        case NodeKind::AttributeAccess:
        case NodeKind::NameRef:
        case NodeKind::Constant:
            compile_expr(node);
            return;
    }
    unsupported(node, "unknown statement kind");
}

void Compiler::visit(const AssignNode* node) {
    if (node->targets.empty()) {
        throw CompilerError("Assignment without target at " + path_string(), node->line);
    }

    // Name targets join the local set before the value is lowered, so
    // `x = x + 1` reads the local x.
    for (const auto& target : node->targets) {
        declare_target(target.get());
    }

    {
        PathGuard guard(*this, "value");
        compile_expr(node->value.get());
    }

    for (size_t i = 0; i < node->targets.size(); ++i) {
        PathGuard guard(*this, "targets[" + std::to_string(i) + "]");
        store_accumulator(node->targets[i].get());
    }
}

void Compiler::visit(const AugAssignNode* node) {
    if (node->target && node->target->kind == NodeKind::Subscript) {
        aug_assign_element(static_cast<const SubscriptNode*>(node->target.get()), node->op, node->value.get(),
                           node->line);
        return;
    }
    declare_target(node->target.get());
    compile_binary(node->op, node->target.get(), node->value.get(), node->line);
    PathGuard guard(*this, "target");
    store_accumulator(node->target.get());
}

// Base and index are evaluated once and kept on the stack across the value.
void Compiler::aug_assign_element(const SubscriptNode* target, BinaryOperator op, const Node* value,
                                  uint32_t line) {
    const Operand rax = Operand::make_reg(Reg::RAX);
    const Operand rbx = Operand::make_reg(Reg::RBX);
    const Operand rcx = Operand::make_reg(Reg::RCX);
    {
        PathGuard guard(*this, "target");
        compile_operands(target->value.get(), target->index.get(), "value", "index", line);
    }
    emit(Mnemonic::PUSH, {rbx}, line);
    emit(Mnemonic::PUSH, {rax}, line);
    emit(Mnemonic::MOV, {rax, Operand::element(Reg::RBX, Reg::RAX, 8)}, line);

    compile_right_operand(value, "value", line);
    apply_operator(op, line);

    emit(Mnemonic::POP, {rcx}, line);
    emit(Mnemonic::POP, {rbx}, line);
    emit(Mnemonic::MOV, {Operand::element(Reg::RBX, Reg::RCX, 8), rax}, line);
}

void Compiler::visit(const ReturnNode* node) {
    if (node->value) {
        PathGuard guard(*this, "value");
        compile_expr(node->value.get());
    } else {
        emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(0)}, node->line);
    }
    emit_epilogue(node->line);
}

void Compiler::visit(const ExprStatementNode* node) {
    PathGuard guard(*this, "value");
    compile_expr(node->expression.get());
}

void Compiler::visit(const IfNode* node) {
    const std::string id = std::to_string(ctx_.next_label_id());
    const std::string else_label = "else_" + id;
    const std::string end_label = "end_" + id;

    {
        PathGuard guard(*this, "test");
        compile_expr(node->condition.get());
    }
    emit(Mnemonic::TEST, {Operand::make_reg(Reg::RAX), Operand::make_reg(Reg::RAX)}, node->line);
    emit(Mnemonic::JZ, {Operand::make_symbol(else_label)}, node->line);

    compile_block(node->then_body, "body");
    emit(Mnemonic::JMP, {Operand::make_symbol(end_label)}, node->line);

    emit_label(else_label, node->line);
    compile_block(node->else_body, "orelse");
    emit_label(end_label, node->line);
}

void Compiler::visit(const WhileNode* node) {
    const std::string id = std::to_string(ctx_.next_label_id());
    const std::string loop_label = "loop_" + id;
    const std::string end_label = "end_" + id;

    emit_label(loop_label, node->line);
    {
        PathGuard guard(*this, "test");
        compile_expr(node->condition.get());
    }
    emit(Mnemonic::TEST, {Operand::make_reg(Reg::RAX), Operand::make_reg(Reg::RAX)}, node->line);
    emit(Mnemonic::JZ, {Operand::make_symbol(end_label)}, node->line);

    compile_block(node->body, "body");

    emit(Mnemonic::JMP, {Operand::make_symbol(loop_label)}, node->line);
    emit_label(end_label, node->line);
}

void Compiler::declare_target(const Node* target) {
    if (target && target->kind == NodeKind::NameRef) {
        const auto& name = static_cast<const NameRefNode*>(target)->id;
        if (builtin_constant_value(name)) {
            throw CompilerError("Cannot assign to built-in constant '" + name + "' at " + path_string(),
                                target->line);
        }
        scope_->declare_local(name);
    }
}

void Compiler::store_accumulator(const Node* target) {
    if (!target) {
        throw CompilerError("Null assignment target at " + path_string());
    }

    switch (target->kind) {
        case NodeKind::NameRef: {
            const auto& name = static_cast<const NameRefNode*>(target)->id;
            emit(Mnemonic::MOV, {scope_->slot(name), Operand::make_reg(Reg::RAX)}, target->line);
            return;
        }
        case NodeKind::Subscript: {
            const auto* sub = static_cast<const SubscriptNode*>(target);
            emit(Mnemonic::PUSH, {Operand::make_reg(Reg::RAX)}, target->line);
            compile_operands(sub->value.get(), sub->index.get(), "value", "index", target->line);
            emit(Mnemonic::MOV, {Operand::make_reg(Reg::RCX), Operand::make_reg(Reg::RAX)}, target->line);
            emit(Mnemonic::POP, {Operand::make_reg(Reg::RAX)}, target->line);
            emit(Mnemonic::MOV, {Operand::element(Reg::RBX, Reg::RCX, 8), Operand::make_reg(Reg::RAX)},
                 target->line);
            return;
        }
        case NodeKind::AttributeAccess:
            unsupported(target, "attribute assignment has no object model");
        case NodeKind::FunctionDef:
        case NodeKind::Assign:
        case NodeKind::AugAssign:
        case NodeKind::Return:
        case NodeKind::ExprStatement:
        case NodeKind::If:
        case NodeKind::While:
        case NodeKind::BinaryOp:
        case NodeKind::Compare:
        case NodeKind::Call:
        case NodeKind::ListLiteral:
        case NodeKind::DictLiteral:
        case NodeKind::Constant:
            unsupported(target, "not an assignment target");
    }
    unsupported(target, "not an assignment target");
}

void Compiler::emit(Mnemonic m, std::vector<Operand> operands, uint32_t line) {
    unit_.write(m, std::move(operands), line);
}

void Compiler::emit_label(const std::string& name, uint32_t line) {
    unit_.write_label(name, line);
}

void Compiler::emit_epilogue(uint32_t line) {
    emit(Mnemonic::MOV, {Operand::make_reg(Reg::RSP), Operand::make_reg(Reg::RBP)}, line);
    emit(Mnemonic::POP, {Operand::make_reg(Reg::RBP)}, line);
    emit(Mnemonic::RET, {}, line);
}

std::string Compiler::add_region(const char* prefix, size_t quadwords) {
    DataRegion region;
    region.kind = DataRegion::Kind::Reserve;
    region.symbol = ctx_.fresh_label(prefix);
    region.quadwords = quadwords;
    unit_.data.push_back(region);
    return region.symbol;
}

std::string Compiler::path_string() const {
    std::string out;
    for (const auto& segment : path_) {
        if (!out.empty()) {
            out += ".";
        }
        out += segment;
    }
    return out;
}

void Compiler::unsupported(const Node* node, const std::string& detail) {
    throw UnsupportedConstruct(node_kind_name(node->kind), path_string(), detail, node->line);
}

} // namespace asmlower
