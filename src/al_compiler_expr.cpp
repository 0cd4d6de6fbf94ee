#include "al_compiler.hpp"
#include "al_core.hpp"

namespace asmlower {

namespace {

bool is_leaf(const Node* node) {
    return node && (node->kind == NodeKind::Constant || node->kind == NodeKind::NameRef);
}

Mnemonic jump_for(CompareOperator op) {
    switch (op) {
        case CompareOperator::Greater:      return Mnemonic::JG;
        case CompareOperator::Less:         return Mnemonic::JL;
        case CompareOperator::Equal:        return Mnemonic::JE;
        case CompareOperator::NotEqual:     return Mnemonic::JNE;
        case CompareOperator::LessEqual:    return Mnemonic::JLE;
        case CompareOperator::GreaterEqual: return Mnemonic::JGE;
    }
    return Mnemonic::JE;
}

} // anonymous namespace

void Compiler::compile_expr(const Node* node) {
    if (!node) {
        throw CompilerError("Null expression at " + path_string());
    }

    RecursionGuard guard(*this);

    switch (node->kind) {
        case NodeKind::Constant:
            visit(static_cast<const ConstantNode*>(node));
            return;
        case NodeKind::NameRef:
            visit(static_cast<const NameRefNode*>(node));
            return;
        case NodeKind::BinaryOp:
            visit(static_cast<const BinaryOpNode*>(node));
            return;
        case NodeKind::Compare:
            visit(static_cast<const CompareNode*>(node));
            return;
        case NodeKind::Call:
            visit(static_cast<const CallNode*>(node));
            return;
        case NodeKind::ListLiteral:
            visit(static_cast<const ListLiteralNode*>(node));
            return;
        case NodeKind::DictLiteral:
            visit(static_cast<const DictLiteralNode*>(node));
            return;
        case NodeKind::Subscript:
            visit(static_cast<const SubscriptNode*>(node));
            return;
        case NodeKind::AttributeAccess:
            unsupported(node, "attribute access has no object model");
        case NodeKind::FunctionDef:
        case NodeKind::Assign:
        case NodeKind::AugAssign:
        case NodeKind::Return:
        case NodeKind::ExprStatement:
        case NodeKind::If:
        case NodeKind::While:
            unsupported(node, "statement used as an expression");
    }
    unsupported(node, "unknown expression kind");
}

void Compiler::visit(const ConstantNode* node) {
    switch (node->type) {
        case ConstantNode::Type::Int:
            emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(node->int_value)}, node->line);
            return;
        case ConstantNode::Type::Bool:
            emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(node->bool_value ? 1 : 0)},
                 node->line);
            return;
        case ConstantNode::Type::None:
            emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(0)}, node->line);
            return;
        case ConstantNode::Type::String: {
            DataRegion region;
            region.kind = DataRegion::Kind::String;
            region.symbol = ctx_.fresh_label("str");
            region.bytes = node->string_value;
            unit_.data.push_back(region);
            emit(Mnemonic::LEA, {Operand::make_reg(Reg::RAX), Operand::make_symbol(region.symbol)}, node->line);
            return;
        }
    }
}

void Compiler::visit(const NameRefNode* node) {
    Resolution res = resolve_name(node->id, *scope_, ctx_);
    switch (res.name_class) {
        case NameClass::BuiltinConstant:
            emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(res.builtin_value)}, node->line);
            return;
        case NameClass::Local:
        case NameClass::Global:
            emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), res.storage}, node->line);
            return;
    }
}

void Compiler::compile_operands(const Node* left, const Node* right,
                                const char* left_field, const char* right_field, uint32_t line) {
    {
        PathGuard guard(*this, left_field);
        compile_expr(left);
    }
    compile_right_operand(right, right_field, line);
}

void Compiler::compile_right_operand(const Node* right, const char* field, uint32_t line) {
    emit(Mnemonic::MOV, {Operand::make_reg(Reg::RBX), Operand::make_reg(Reg::RAX)}, line);

    // A compound right operand uses the scratch register itself.
    const bool preserve = !is_leaf(right);
    if (preserve) {
        emit(Mnemonic::PUSH, {Operand::make_reg(Reg::RBX)}, line);
    }
    {
        PathGuard guard(*this, field);
        compile_expr(right);
    }
    if (preserve) {
        emit(Mnemonic::POP, {Operand::make_reg(Reg::RBX)}, line);
    }
}

void Compiler::compile_binary(BinaryOperator op, const Node* left, const Node* right, uint32_t line) {
    compile_operands(left, right, "left", "right", line);
    apply_operator(op, line);
}

// rbx holds the left operand, rax the right one; the result lands in rax.
void Compiler::apply_operator(BinaryOperator op, uint32_t line) {
    const Operand rax = Operand::make_reg(Reg::RAX);
    const Operand rbx = Operand::make_reg(Reg::RBX);

    switch (op) {
        case BinaryOperator::Add:
            emit(Mnemonic::ADD, {rax, rbx}, line);
            return;
        case BinaryOperator::Sub:
            emit(Mnemonic::XCHG, {rax, rbx}, line);
            emit(Mnemonic::SUB, {rax, rbx}, line);
            return;
        case BinaryOperator::Mult:
            emit(Mnemonic::IMUL, {rax, rbx}, line);
            return;
        case BinaryOperator::Div:
        case BinaryOperator::Mod:
            // Widen the dividend into rdx:rax; a zero divisor faults at run time.
            emit(Mnemonic::XCHG, {rax, rbx}, line);
            emit(Mnemonic::CQO, {}, line);
            emit(Mnemonic::IDIV, {rbx}, line);
            if (op == BinaryOperator::Mod) {
                emit(Mnemonic::MOV, {rax, Operand::make_reg(Reg::RDX)}, line);
            }
            return;
    }
}

void Compiler::visit(const BinaryOpNode* node) {
    compile_binary(node->op, node->left.get(), node->right.get(), node->line);
}

void Compiler::visit(const CompareNode* node) {
    compile_operands(node->left.get(), node->right.get(), "left", "right", node->line);

    const std::string id = std::to_string(ctx_.next_label_id());
    const std::string true_label = "true_" + id;
    const std::string false_label = "false_" + id;
    const std::string end_label = "end_" + id;

    emit(Mnemonic::CMP, {Operand::make_reg(Reg::RBX), Operand::make_reg(Reg::RAX)}, node->line);
    emit(jump_for(node->op), {Operand::make_symbol(true_label)}, node->line);
    emit(Mnemonic::JMP, {Operand::make_symbol(false_label)}, node->line);

    emit_label(true_label, node->line);
    emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(1)}, node->line);
    emit(Mnemonic::JMP, {Operand::make_symbol(end_label)}, node->line);

    emit_label(false_label, node->line);
    emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(0)}, node->line);
    emit_label(end_label, node->line);
}

void Compiler::visit(const CallNode* node) {
    if (ctx_.is_function(node->callee)) {
        size_t expected = ctx_.arity(node->callee);
        if (expected != node->arguments.size()) {
            throw CompilerError("Function '" + node->callee + "' expects " + std::to_string(expected) +
                                    " arguments, got " + std::to_string(node->arguments.size()) +
                                    " at " + path_string(),
                                node->line);
        }
    } else if (is_reserved_symbol(node->callee)) {
        throw CompilerError("Call to '" + node->callee + "' clashes with generated symbols at " + path_string(),
                            node->line);
    } else {
        unit_.externs.insert(node->callee);
    }

    for (size_t i = 0; i < node->arguments.size(); ++i) {
        PathGuard guard(*this, "args[" + std::to_string(i) + "]");
        compile_expr(node->arguments[i].get());
        emit(Mnemonic::PUSH, {Operand::make_reg(Reg::RAX)}, node->line);
    }

    emit(Mnemonic::CALL, {Operand::make_symbol(node->callee)}, node->line);
    if (!node->arguments.empty()) {
        emit(Mnemonic::ADD, {Operand::make_reg(Reg::RSP),
                             Operand::make_imm(8 * static_cast<int64_t>(node->arguments.size()))},
             node->line);
    }
}

// Elements are staged on the stack and written only once all of them are
// evaluated, so a call inside the literal that re-enters it cannot clobber
// the shared region.
void Compiler::visit(const ListLiteralNode* node) {
    const size_t count = node->elements.size();
    const std::string region = add_region("list", count + 1);

    for (size_t i = 0; i < count; ++i) {
        PathGuard guard(*this, "elts[" + std::to_string(i) + "]");
        compile_expr(node->elements[i].get());
        emit(Mnemonic::PUSH, {Operand::make_reg(Reg::RAX)}, node->line);
    }

    fill_region(region, count, count, node->line);
}

void Compiler::visit(const DictLiteralNode* node) {
    if (node->keys.size() != node->values.size()) {
        throw CompilerError("Dict literal with " + std::to_string(node->keys.size()) + " keys and " +
                                std::to_string(node->values.size()) + " values at " + path_string(),
                            node->line);
    }

    // No hashing: pairs are laid out in source order, duplicates included.
    const size_t count = node->keys.size();
    const std::string region = add_region("dict", 1 + 2 * count);

    for (size_t i = 0; i < count; ++i) {
        {
            PathGuard guard(*this, "keys[" + std::to_string(i) + "]");
            compile_expr(node->keys[i].get());
        }
        emit(Mnemonic::PUSH, {Operand::make_reg(Reg::RAX)}, node->line);
        {
            PathGuard guard(*this, "values[" + std::to_string(i) + "]");
            compile_expr(node->values[i].get());
        }
        emit(Mnemonic::PUSH, {Operand::make_reg(Reg::RAX)}, node->line);
    }

    fill_region(region, count, 2 * count, node->line);
}

// Writes the count word, then pops `staged` words into slots staged..1.
void Compiler::fill_region(const std::string& region, size_t count, size_t staged, uint32_t line) {
    emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::make_imm(static_cast<int64_t>(count))}, line);
    emit(Mnemonic::MOV, {Operand::global(region), Operand::make_reg(Reg::RAX)}, line);

    for (size_t slot = staged; slot > 0; --slot) {
        emit(Mnemonic::POP, {Operand::make_reg(Reg::RAX)}, line);
        emit(Mnemonic::MOV, {Operand::global(region, 8 * static_cast<int64_t>(slot)), Operand::make_reg(Reg::RAX)},
             line);
    }

    emit(Mnemonic::LEA, {Operand::make_reg(Reg::RAX), Operand::make_symbol(region)}, line);
}

void Compiler::visit(const SubscriptNode* node) {
    compile_operands(node->value.get(), node->index.get(), "value", "index", node->line);
    // Element i follows the length word.
    emit(Mnemonic::MOV, {Operand::make_reg(Reg::RAX), Operand::element(Reg::RBX, Reg::RAX, 8)}, node->line);
}

} // namespace asmlower
