#include "al_tree_reader.hpp"
#include "al_compiler.hpp"
#include <fstream>
#include <limits>

namespace asmlower {

namespace {

using json = nlohmann::json;

bool parse_binary_operator(const std::string& name, BinaryOperator& out) {
    if (name == "Add")  { out = BinaryOperator::Add;  return true; }
    if (name == "Sub")  { out = BinaryOperator::Sub;  return true; }
    if (name == "Mult") { out = BinaryOperator::Mult; return true; }
    if (name == "Div")  { out = BinaryOperator::Div;  return true; }
    if (name == "Mod")  { out = BinaryOperator::Mod;  return true; }
    return false;
}

bool parse_compare_operator(const std::string& name, CompareOperator& out) {
    if (name == "Gt")    { out = CompareOperator::Greater;      return true; }
    if (name == "Lt")    { out = CompareOperator::Less;         return true; }
    if (name == "Eq")    { out = CompareOperator::Equal;        return true; }
    if (name == "NotEq") { out = CompareOperator::NotEqual;     return true; }
    if (name == "LtE")   { out = CompareOperator::LessEqual;    return true; }
    if (name == "GtE")   { out = CompareOperator::GreaterEqual; return true; }
    return false;
}

class TreeReader {
public:
    Module read(const json& document) {
        if (!document.is_object()) {
            throw TreeFormatError("Document must be an object", "");
        }
        auto body_it = document.find("body");
        if (body_it == document.end() || !body_it->is_array()) {
            throw TreeFormatError("Document needs a 'body' array", "");
        }
        const json& body = *body_it;

        Module module;
        for (size_t i = 0; i < body.size(); ++i) {
            PathGuard guard(*this, "body[" + std::to_string(i) + "]");
            const json& item = body[i];
            std::string kind = kind_of(item);
            if (kind != "FunctionDef") {
                throw UnsupportedConstruct(kind, path_string(),
                                           "top-level statements must be function definitions",
                                           line_of(item));
            }
            module.functions.push_back(read_function(item));
        }
        return module;
    }

private:
    std::vector<std::string> path_;

    class PathGuard {
    public:
        PathGuard(TreeReader& reader, std::string segment) : reader_(reader) {
            reader_.path_.push_back(std::move(segment));
        }
        ~PathGuard() {
            reader_.path_.pop_back();
        }
        PathGuard(const PathGuard&) = delete;
        PathGuard& operator=(const PathGuard&) = delete;
    private:
        TreeReader& reader_;
    };

    std::string path_string() const {
        std::string out;
        for (const auto& segment : path_) {
            if (!out.empty()) {
                out += ".";
            }
            out += segment;
        }
        return out;
    }

    [[noreturn]] void malformed(const std::string& msg) const {
        throw TreeFormatError(msg, path_string());
    }

    std::string kind_of(const json& node) const {
        if (!node.is_object()) {
            malformed("Node must be an object");
        }
        auto it = node.find("kind");
        if (it == node.end() || !it->is_string()) {
            malformed("Node needs a string 'kind'");
        }
        return it->get<std::string>();
    }

    uint32_t line_of(const json& node) const {
        auto it = node.find("line");
        if (it == node.end() || it->is_null()) {
            return 0;
        }
        if (!it->is_number_integer() || it->get<int64_t>() < 0) {
            malformed("'line' must be a non-negative integer");
        }
        return static_cast<uint32_t>(it->get<int64_t>());
    }

    const json& field(const json& node, const char* name) const {
        auto it = node.find(name);
        if (it == node.end()) {
            malformed(std::string("Missing field '") + name + "'");
        }
        return *it;
    }

    std::string string_field(const json& node, const char* name) const {
        const json& value = field(node, name);
        if (!value.is_string()) {
            malformed(std::string("Field '") + name + "' must be a string");
        }
        return value.get<std::string>();
    }

    NodePtr child(const json& node, const char* name) {
        const json& value = field(node, name);
        PathGuard guard(*this, name);
        return read_node(value);
    }

    // Missing or null reads as an empty list when optional.
    NodeList children(const json& node, const char* name, bool optional = false) {
        NodeList out;
        auto it = node.find(name);
        if (it == node.end() || it->is_null()) {
            if (optional) {
                return out;
            }
            malformed(std::string("Missing field '") + name + "'");
        }
        if (!it->is_array()) {
            malformed(std::string("Field '") + name + "' must be an array");
        }
        for (size_t i = 0; i < it->size(); ++i) {
            PathGuard guard(*this, std::string(name) + "[" + std::to_string(i) + "]");
            out.push_back(read_node((*it)[i]));
        }
        return out;
    }

    template<typename T>
    std::unique_ptr<T> make(const json& node) {
        auto out = std::make_unique<T>();
        out->line = line_of(node);
        return out;
    }

    FunctionDefPtr read_function(const json& node) {
        auto fn = make<FunctionDef>(node);
        fn->name = string_field(node, "name");

        const json& args = field(node, "args");
        if (!args.is_array()) {
            malformed("Field 'args' must be an array");
        }
        for (size_t i = 0; i < args.size(); ++i) {
            const json& arg = args[i];
            if (arg.is_string()) {
                fn->params.push_back(arg.get<std::string>());
            } else if (arg.is_object() && arg.contains("arg") && arg.at("arg").is_string()) {
                fn->params.push_back(arg.at("arg").get<std::string>());
            } else {
                PathGuard guard(*this, "args[" + std::to_string(i) + "]");
                malformed("Parameter must be a name");
            }
        }

        fn->body = children(node, "body");
        return fn;
    }

    NodePtr read_node(const json& node) {
        const std::string kind = kind_of(node);

        if (kind == "FunctionDef") {
            return read_function(node);
        }
        if (kind == "Assign") {
            auto out = make<AssignNode>(node);
            out->targets = children(node, "targets");
            out->value = child(node, "value");
            return out;
        }
        if (kind == "AugAssign") {
            auto out = make<AugAssignNode>(node);
            out->target = child(node, "target");
            out->op = binary_operator(node);
            out->value = child(node, "value");
            return out;
        }
        if (kind == "Return") {
            auto out = make<ReturnNode>(node);
            auto it = node.find("value");
            if (it != node.end() && !it->is_null()) {
                out->value = child(node, "value");
            }
            return out;
        }
        if (kind == "Expr") {
            auto out = make<ExprStatementNode>(node);
            out->expression = child(node, "value");
            return out;
        }
        if (kind == "If") {
            auto out = make<IfNode>(node);
            out->condition = child(node, "test");
            out->then_body = children(node, "body");
            out->else_body = children(node, "orelse", true);
            return out;
        }
        if (kind == "While") {
            auto out = make<WhileNode>(node);
            out->condition = child(node, "test");
            out->body = children(node, "body");
            return out;
        }
        if (kind == "BinOp") {
            auto out = make<BinaryOpNode>(node);
            out->op = binary_operator(node);
            out->left = child(node, "left");
            out->right = child(node, "right");
            return out;
        }
        if (kind == "Compare") {
            auto out = make<CompareNode>(node);
            const std::string op = string_field(node, "op");
            if (!parse_compare_operator(op, out->op)) {
                throw UnsupportedConstruct("Compare", path_string(), "operator " + op, out->line);
            }
            out->left = child(node, "left");
            out->right = child(node, "right");
            return out;
        }
        if (kind == "Call") {
            auto out = make<CallNode>(node);
            out->callee = callee_name(node);
            out->arguments = children(node, "args", true);
            return out;
        }
        if (kind == "List") {
            auto out = make<ListLiteralNode>(node);
            out->elements = children(node, "elts");
            return out;
        }
        if (kind == "Dict") {
            auto out = make<DictLiteralNode>(node);
            out->keys = children(node, "keys");
            out->values = children(node, "values");
            if (out->keys.size() != out->values.size()) {
                malformed("Dict needs as many values as keys");
            }
            return out;
        }
        if (kind == "Subscript") {
            auto out = make<SubscriptNode>(node);
            out->value = child(node, "value");
            out->index = child(node, "index");
            return out;
        }
        if (kind == "Attribute") {
            auto out = make<AttributeAccessNode>(node);
            out->object = child(node, "value");
            out->attribute = string_field(node, "attr");
            return out;
        }
        if (kind == "Name") {
            auto out = make<NameRefNode>(node);
            out->id = string_field(node, "id");
            return out;
        }
        if (kind == "Constant") {
            return read_constant(node);
        }

        throw UnsupportedConstruct(kind, path_string(), "unknown node kind", line_of(node));
    }

    BinaryOperator binary_operator(const json& node) const {
        const std::string op = string_field(node, "op");
        BinaryOperator out = BinaryOperator::Add;
        if (!parse_binary_operator(op, out)) {
            throw UnsupportedConstruct(kind_of(node), path_string(), "operator " + op, line_of(node));
        }
        return out;
    }

    // `func` is either a plain string or a Name node.
    std::string callee_name(const json& node) {
        const json& func = field(node, "func");
        if (func.is_string()) {
            return func.get<std::string>();
        }
        PathGuard guard(*this, "func");
        const std::string kind = kind_of(func);
        if (kind != "Name") {
            throw UnsupportedConstruct(kind, path_string(), "only direct calls by name are supported",
                                       line_of(func));
        }
        return string_field(func, "id");
    }

    NodePtr read_constant(const json& node) {
        const json& value = field(node, "value");
        const uint32_t line = line_of(node);
        std::unique_ptr<ConstantNode> out;

        if (value.is_boolean()) {
            out = ConstantNode::make_bool(value.get<bool>());
        } else if (value.is_number_float()) {
            throw UnsupportedConstruct("Constant", path_string(), "float constants are not supported", line);
        } else if (value.is_number_unsigned()) {
            const uint64_t v = value.get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                malformed("Integer constant out of range");
            }
            out = ConstantNode::make_int(static_cast<int64_t>(v));
        } else if (value.is_number_integer()) {
            out = ConstantNode::make_int(value.get<int64_t>());
        } else if (value.is_null()) {
            out = ConstantNode::make_none();
        } else if (value.is_string()) {
            out = ConstantNode::make_string(value.get<std::string>());
        } else {
            throw UnsupportedConstruct("Constant", path_string(),
                                       std::string("constant of type ") + value.type_name(), line);
        }

        out->line = line;
        return out;
    }
};

} // anonymous namespace

Module read_tree(const nlohmann::json& document) {
    TreeReader reader;
    return reader.read(document);
}

Module parse_tree(const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw TreeFormatError(std::string("Invalid JSON: ") + e.what(), "");
    }
    return read_tree(document);
}

Module load_tree(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw TreeFormatError("Cannot open tree file: " + path.string(), "");
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return parse_tree(text);
}

} // namespace asmlower
