#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace asmlower {

// ---- Forward declarations ----
struct Node;
struct FunctionDef;

using NodePtr = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;

// ============================================================
//  Node kinds
// ============================================================

// Closed set. Every switch over NodeKind is written without a default
// label so that a new kind without a lowering rule fails to build.
enum class NodeKind {
    // Statements
    FunctionDef,
    Assign,
    AugAssign,       // x += e
    Return,
    ExprStatement,   // expression evaluated for its effect
    If,
    While,

    // Expressions
    BinaryOp,
    Compare,
    Call,
    ListLiteral,     // [1, 2, 3]
    DictLiteral,     // {'a': 1}
    Subscript,       // xs[i]
    AttributeAccess, // obj.attr
    NameRef,
    Constant,
};

const char* node_kind_name(NodeKind kind);

enum class BinaryOperator {
    Add,
    Sub,
    Mult,
    Div,
    Mod,
};

enum class CompareOperator {
    Greater,
    Less,
    Equal,
    NotEqual,
    LessEqual,
    GreaterEqual,
};

const char* binary_operator_name(BinaryOperator op);
const char* compare_operator_name(CompareOperator op);

struct Node {
    NodeKind kind;
    uint32_t line{0};
    virtual ~Node() = default;
protected:
    explicit Node(NodeKind k) : kind(k) {}
};

// ============================================================
//  Expressions
// ============================================================

struct ConstantNode : Node {
    enum class Type { Int, Bool, None, String };

    Type type{Type::None};
    int64_t int_value{0};
    bool bool_value{false};
    std::string string_value;

    ConstantNode() : Node(NodeKind::Constant) {}

    static std::unique_ptr<ConstantNode> make_int(int64_t v) {
        auto node = std::make_unique<ConstantNode>();
        node->type = Type::Int;
        node->int_value = v;
        return node;
    }

    static std::unique_ptr<ConstantNode> make_bool(bool v) {
        auto node = std::make_unique<ConstantNode>();
        node->type = Type::Bool;
        node->bool_value = v;
        return node;
    }

    static std::unique_ptr<ConstantNode> make_none() {
        return std::make_unique<ConstantNode>();
    }

    static std::unique_ptr<ConstantNode> make_string(std::string s) {
        auto node = std::make_unique<ConstantNode>();
        node->type = Type::String;
        node->string_value = std::move(s);
        return node;
    }
};

struct NameRefNode : Node {
    std::string id;
    NameRefNode() : Node(NodeKind::NameRef) {}
    explicit NameRefNode(std::string n) : Node(NodeKind::NameRef), id(std::move(n)) {}
};

struct BinaryOpNode : Node {
    BinaryOperator op;
    NodePtr left;
    NodePtr right;
    BinaryOpNode() : Node(NodeKind::BinaryOp), op(BinaryOperator::Add) {}
    BinaryOpNode(BinaryOperator o, NodePtr l, NodePtr r)
        : Node(NodeKind::BinaryOp), op(o), left(std::move(l)), right(std::move(r)) {}
};

struct CompareNode : Node {
    CompareOperator op;
    NodePtr left;
    NodePtr right;
    CompareNode() : Node(NodeKind::Compare), op(CompareOperator::Equal) {}
    CompareNode(CompareOperator o, NodePtr l, NodePtr r)
        : Node(NodeKind::Compare), op(o), left(std::move(l)), right(std::move(r)) {}
};

// Direct call by function name. Callees outside the compilation become externs.
struct CallNode : Node {
    std::string callee;
    NodeList arguments;
    CallNode() : Node(NodeKind::Call) {}
    explicit CallNode(std::string name) : Node(NodeKind::Call), callee(std::move(name)) {}
};

struct ListLiteralNode : Node {
    NodeList elements;
    ListLiteralNode() : Node(NodeKind::ListLiteral) {}
};

struct DictLiteralNode : Node {
    NodeList keys;
    NodeList values;  // same length as keys
    DictLiteralNode() : Node(NodeKind::DictLiteral) {}
};

struct SubscriptNode : Node {
    NodePtr value;
    NodePtr index;
    SubscriptNode() : Node(NodeKind::Subscript) {}
    SubscriptNode(NodePtr v, NodePtr i)
        : Node(NodeKind::Subscript), value(std::move(v)), index(std::move(i)) {}
};

struct AttributeAccessNode : Node {
    NodePtr object;
    std::string attribute;
    AttributeAccessNode() : Node(NodeKind::AttributeAccess) {}
    AttributeAccessNode(NodePtr obj, std::string attr)
        : Node(NodeKind::AttributeAccess), object(std::move(obj)), attribute(std::move(attr)) {}
};

// ============================================================
//  Statements
// ============================================================

struct AssignNode : Node {
    NodeList targets;  // NameRef, Subscript or AttributeAccess
    NodePtr value;
    AssignNode() : Node(NodeKind::Assign) {}
};

struct AugAssignNode : Node {
    NodePtr target;
    BinaryOperator op;
    NodePtr value;
    AugAssignNode() : Node(NodeKind::AugAssign), op(BinaryOperator::Add) {}
};

struct ReturnNode : Node {
    NodePtr value;  // nullptr for a bare return
    ReturnNode() : Node(NodeKind::Return) {}
    explicit ReturnNode(NodePtr v) : Node(NodeKind::Return), value(std::move(v)) {}
};

struct ExprStatementNode : Node {
    NodePtr expression;
    ExprStatementNode() : Node(NodeKind::ExprStatement) {}
    explicit ExprStatementNode(NodePtr e) : Node(NodeKind::ExprStatement), expression(std::move(e)) {}
};

struct IfNode : Node {
    NodePtr condition;
    NodeList then_body;
    NodeList else_body;  // empty when there is no else
    IfNode() : Node(NodeKind::If) {}
};

struct WhileNode : Node {
    NodePtr condition;
    NodeList body;
    WhileNode() : Node(NodeKind::While) {}
};

struct FunctionDef : Node {
    std::string name;
    std::vector<std::string> params;
    NodeList body;
    FunctionDef() : Node(NodeKind::FunctionDef) {}
    explicit FunctionDef(std::string n) : Node(NodeKind::FunctionDef), name(std::move(n)) {}
};

using FunctionDefPtr = std::unique_ptr<FunctionDef>;

// Ordered top-level functions handed over by the external parser.
struct Module {
    std::vector<FunctionDefPtr> functions;
};

} // namespace asmlower
