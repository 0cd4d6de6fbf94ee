#pragma once

#include "al_ast.hpp"
#include "al_context.hpp"
#include "al_instruction.hpp"
#include "al_scope.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace asmlower {

class CompilerError : public std::runtime_error {
public:
    CompilerError(const std::string& msg, uint32_t line = 0)
        : std::runtime_error(line > 0 ? msg + " (line " + std::to_string(line) + ")" : msg)
        , line_(line) {}

    uint32_t line() const { return line_; }

private:
    uint32_t line_;
};

// Tree traversal reached a node with no lowering rule. Aborts the whole
// compilation.
class UnsupportedConstruct : public CompilerError {
public:
    UnsupportedConstruct(std::string node_kind, std::string path,
                         const std::string& detail = "", uint32_t line = 0)
        : CompilerError("Unsupported construct " + node_kind + " at " + path +
                            (detail.empty() ? "" : ": " + detail), line)
        , node_kind_(std::move(node_kind))
        , path_(std::move(path)) {}

    const std::string& node_kind() const { return node_kind_; }
    const std::string& path() const { return path_; }

private:
    std::string node_kind_;
    std::string path_;
};

// Names the lowering generates itself: numbered labels, data regions,
// global storage and the entry stub.
bool is_reserved_symbol(const std::string& name);

class Compiler {
public:
    explicit Compiler(CompilationContext& ctx) : ctx_(ctx) {}

    // Lowers every function of the module. With jobs > 1 functions are
    // lowered on worker threads; units are returned in source order.
    Program compile(const Module& module, size_t jobs = 1);

    // Lowers one function. Its name must already be declared in the context
    // for recursive calls to resolve.
    CompiledUnit compile_function(const FunctionDef& fn);

private:
    CompilationContext& ctx_;
    CompiledUnit unit_;
    std::optional<Scope> scope_;
    std::vector<std::string> path_;
    int recursion_depth_{0};

    static constexpr int MAX_RECURSION_DEPTH = 256;

    void compile_block(const NodeList& body, const char* field);
    void compile_stmt(const Node* node);
    void compile_expr(const Node* node);

    void visit(const AssignNode* node);
    void visit(const AugAssignNode* node);
    void visit(const ReturnNode* node);
    void visit(const ExprStatementNode* node);
    void visit(const IfNode* node);
    void visit(const WhileNode* node);

    void visit(const ConstantNode* node);
    void visit(const NameRefNode* node);
    void visit(const BinaryOpNode* node);
    void visit(const CompareNode* node);
    void visit(const CallNode* node);
    void visit(const ListLiteralNode* node);
    void visit(const DictLiteralNode* node);
    void visit(const SubscriptNode* node);

    // Left operand ends in the scratch register, right in the accumulator.
    void compile_operands(const Node* left, const Node* right,
                          const char* left_field, const char* right_field, uint32_t line);
    void compile_right_operand(const Node* right, const char* field, uint32_t line);
    void compile_binary(BinaryOperator op, const Node* left, const Node* right, uint32_t line);
    void apply_operator(BinaryOperator op, uint32_t line);
    void fill_region(const std::string& region, size_t count, size_t staged, uint32_t line);
    void aug_assign_element(const SubscriptNode* target, BinaryOperator op, const Node* value, uint32_t line);
    void store_accumulator(const Node* target);
    void declare_target(const Node* target);

    void emit(Mnemonic m, std::vector<Operand> operands, uint32_t line);
    void emit_label(const std::string& name, uint32_t line);
    void emit_epilogue(uint32_t line);
    std::string add_region(const char* prefix, size_t quadwords);

    std::string path_string() const;
    [[noreturn]] void unsupported(const Node* node, const std::string& detail);

    // Helper classes
    class PathGuard {
    public:
        PathGuard(Compiler& compiler, std::string segment) : compiler_(compiler) {
            compiler_.path_.push_back(std::move(segment));
        }
        ~PathGuard() {
            compiler_.path_.pop_back();
        }
        PathGuard(const PathGuard&) = delete;
        PathGuard& operator=(const PathGuard&) = delete;
    private:
        Compiler& compiler_;
    };

    class RecursionGuard {
    public:
        explicit RecursionGuard(Compiler& compiler) : compiler_(compiler) {
            if (++compiler_.recursion_depth_ > MAX_RECURSION_DEPTH) {
                --compiler_.recursion_depth_;
                throw CompilerError("Maximum recursion depth exceeded at " + compiler_.path_string());
            }
        }
        ~RecursionGuard() {
            --compiler_.recursion_depth_;
        }
        RecursionGuard(const RecursionGuard&) = delete;
        RecursionGuard& operator=(const RecursionGuard&) = delete;
    private:
        Compiler& compiler_;
    };
};

} // namespace asmlower
