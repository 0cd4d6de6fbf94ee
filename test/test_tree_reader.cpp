#include "test_helpers.hpp"
#include "al_tree_reader.hpp"

namespace asmlower {
namespace test {

namespace {

const char* FACTORIAL_TREE = R"({
  "body": [
    {"kind": "FunctionDef", "name": "factorial", "args": ["n"], "line": 1, "body": [
      {"kind": "If", "line": 2,
       "test": {"kind": "Compare", "op": "Eq",
                "left": {"kind": "Name", "id": "n"},
                "right": {"kind": "Constant", "value": 0}},
       "body": [{"kind": "Return", "line": 3, "value": {"kind": "Constant", "value": 1}}],
       "orelse": [{"kind": "Return", "line": 5, "value":
         {"kind": "BinOp", "op": "Mult",
          "left": {"kind": "Name", "id": "n"},
          "right": {"kind": "Call", "func": {"kind": "Name", "id": "factorial"},
                    "args": [{"kind": "BinOp", "op": "Sub",
                              "left": {"kind": "Name", "id": "n"},
                              "right": {"kind": "Constant", "value": 1}}]}}}]}
    ]}
  ]
})";

// def f(): <statement>
std::string wrap_statement(const std::string& statement) {
    return R"({"body": [{"kind": "FunctionDef", "name": "f", "args": [], "body": [)" + statement + "]}]}";
}

} // anonymous namespace

void test_tree_factorial_runs() {
    Module m = parse_tree(FACTORIAL_TREE);
    AssertHelper::assert_equals(size_t(1), m.functions.size());
    AssertHelper::assert_equals(std::string("factorial"), m.functions[0]->name);
    AssertHelper::assert_equals(size_t(1), m.functions[0]->params.size());

    Program program = optimize(compile_module(m));
    AssertHelper::assert_equals(120, Machine(program).call("factorial", {5}));
}

void test_tree_line_numbers() {
    nlohmann::json doc = nlohmann::json::parse(FACTORIAL_TREE);
    doc["body"][0]["line"] = 7;
    Module m = read_tree(doc);

    AssertHelper::assert_equals(int64_t(7), static_cast<int64_t>(m.functions[0]->line));
    const Node* if_node = m.functions[0]->body[0].get();
    AssertHelper::assert_true(if_node->kind == NodeKind::If, "first statement is the if");
    AssertHelper::assert_equals(int64_t(2), static_cast<int64_t>(if_node->line));

    doc["body"][0]["line"] = -1;
    AssertHelper::assert_throws<TreeFormatError>([&] { read_tree(doc); });
}

void test_tree_missing_field_path() {
    // return 1 + <missing>
    const std::string text = wrap_statement(
        R"({"kind": "Return", "value": {"kind": "BinOp", "op": "Add", "left": {"kind": "Constant", "value": 1}}})");
    try {
        parse_tree(text);
    } catch (const TreeFormatError& e) {
        AssertHelper::assert_equals(std::string("body[0].body[0].value"), e.path());
        AssertHelper::assert_contains(e.what(), "Missing field 'right'");
        return;
    }
    throw std::runtime_error("Missing operand must be reported");
}

void test_tree_float_constant_unsupported() {
    const std::string text = wrap_statement(R"({"kind": "Return", "value": {"kind": "Constant", "value": 1.5}})");
    try {
        parse_tree(text);
    } catch (const UnsupportedConstruct& e) {
        AssertHelper::assert_equals(std::string("Constant"), e.node_kind());
        AssertHelper::assert_contains(e.what(), "float");
        return;
    }
    throw std::runtime_error("Float constant must be rejected");
}

void test_tree_unknown_kind() {
    const std::string text = wrap_statement(R"({"kind": "Expr", "value": {"kind": "Lambda", "line": 4}})");
    try {
        parse_tree(text);
    } catch (const UnsupportedConstruct& e) {
        AssertHelper::assert_equals(std::string("Lambda"), e.node_kind());
        AssertHelper::assert_equals(std::string("body[0].body[0].value"), e.path());
        AssertHelper::assert_equals(int64_t(4), static_cast<int64_t>(e.line()));
        return;
    }
    throw std::runtime_error("Unknown kind must be rejected");
}

void test_tree_top_level_statement() {
    const char* text = R"({"body": [{"kind": "Assign", "targets": [{"kind": "Name", "id": "x"}],
                                      "value": {"kind": "Constant", "value": 1}}]})";
    try {
        parse_tree(text);
    } catch (const UnsupportedConstruct& e) {
        AssertHelper::assert_equals(std::string("Assign"), e.node_kind());
        AssertHelper::assert_equals(std::string("body[0]"), e.path());
        return;
    }
    throw std::runtime_error("Top-level assignment must be rejected");
}

void test_tree_invalid_json() {
    std::string msg = AssertHelper::assert_throws<TreeFormatError>([] { parse_tree("{\"body\": [ "); });
    AssertHelper::assert_contains(msg, "Invalid JSON");

    AssertHelper::assert_throws<TreeFormatError>([] { parse_tree("[]"); }, "document must be an object");
    AssertHelper::assert_throws<TreeFormatError>([] { parse_tree("{\"functions\": []}"); }, "body is required");
    AssertHelper::assert_throws<TreeFormatError>([] { load_tree("/nonexistent/asmlower/tree.json"); });
}

void test_tree_argument_forms() {
    // def add(a, b): return a + b, with parameters as {"arg": ...} objects
    const char* text = R"({"body": [
      {"kind": "FunctionDef", "name": "add", "args": [{"arg": "a"}, "b"], "body": [
        {"kind": "Return", "value": {"kind": "BinOp", "op": "Add",
                                     "left": {"kind": "Name", "id": "a"},
                                     "right": {"kind": "Name", "id": "b"}}}]},
      {"kind": "FunctionDef", "name": "main", "args": [], "body": [
        {"kind": "Return", "value": {"kind": "Call", "func": "add",
                                     "args": [{"kind": "Constant", "value": 40},
                                              {"kind": "Constant", "value": 2}]}}]}
    ]})";
    Module m = parse_tree(text);
    AssertHelper::assert_equals(std::string("a"), m.functions[0]->params[0]);
    AssertHelper::assert_equals(std::string("b"), m.functions[0]->params[1]);
    AssertHelper::assert_equals(42, run_function(m, "main"));

    const std::string bad = R"({"body": [{"kind": "FunctionDef", "name": "f", "args": [3], "body": []}]})";
    try {
        parse_tree(bad);
    } catch (const TreeFormatError& e) {
        AssertHelper::assert_equals(std::string("body[0].args[0]"), e.path());
        return;
    }
    throw std::runtime_error("Numeric parameter must be rejected");
}

void test_tree_attribute_callee() {
    const std::string text = wrap_statement(
        R"({"kind": "Expr", "value": {"kind": "Call",
            "func": {"kind": "Attribute", "value": {"kind": "Name", "id": "o"}, "attr": "m"}, "args": []}})");
    try {
        parse_tree(text);
    } catch (const UnsupportedConstruct& e) {
        AssertHelper::assert_equals(std::string("Attribute"), e.node_kind());
        AssertHelper::assert_equals(std::string("body[0].body[0].value.func"), e.path());
        return;
    }
    throw std::runtime_error("Method call must be rejected");
}

void test_tree_aggregates_and_statements() {
    // def f():
    //     d = {1: 2}
    //     xs = [1, 2, 3]
    //     xs[0] += d[1]
    //     while xs[0] < 10: xs[0] = xs[0] * 2
    //     return xs[0]
    const std::string text = R"({"body": [{"kind": "FunctionDef", "name": "f", "args": [], "body": [
      {"kind": "Assign", "targets": [{"kind": "Name", "id": "d"}],
       "value": {"kind": "Dict", "keys": [{"kind": "Constant", "value": 1}],
                                 "values": [{"kind": "Constant", "value": 2}]}},
      {"kind": "Assign", "targets": [{"kind": "Name", "id": "xs"}],
       "value": {"kind": "List", "elts": [{"kind": "Constant", "value": 1},
                                          {"kind": "Constant", "value": 2},
                                          {"kind": "Constant", "value": 3}]}},
      {"kind": "AugAssign", "op": "Add",
       "target": {"kind": "Subscript", "value": {"kind": "Name", "id": "xs"}, "index": {"kind": "Constant", "value": 0}},
       "value": {"kind": "Constant", "value": 2}},
      {"kind": "While",
       "test": {"kind": "Compare", "op": "Lt",
                "left": {"kind": "Subscript", "value": {"kind": "Name", "id": "xs"}, "index": {"kind": "Constant", "value": 0}},
                "right": {"kind": "Constant", "value": 10}},
       "body": [{"kind": "Assign",
                 "targets": [{"kind": "Subscript", "value": {"kind": "Name", "id": "xs"}, "index": {"kind": "Constant", "value": 0}}],
                 "value": {"kind": "BinOp", "op": "Mult",
                           "left": {"kind": "Subscript", "value": {"kind": "Name", "id": "xs"}, "index": {"kind": "Constant", "value": 0}},
                           "right": {"kind": "Constant", "value": 2}}}]},
      {"kind": "Return", "value": {"kind": "Subscript", "value": {"kind": "Name", "id": "xs"},
                                   "index": {"kind": "Constant", "value": 0}}}
    ]}]})";
    Module m = parse_tree(text);
    // 1 + 2 = 3, then 6, then 12
    AssertHelper::assert_equals(12, run_function(m, "f", {}, false));
    AssertHelper::assert_equals(12, run_function(m, "f", {}, true));
}

void test_tree_dict_mismatch() {
    const std::string text = wrap_statement(
        R"({"kind": "Return", "value": {"kind": "Dict", "keys": [{"kind": "Constant", "value": 1}], "values": []}})");
    try {
        parse_tree(text);
    } catch (const TreeFormatError& e) {
        AssertHelper::assert_equals(std::string("body[0].body[0].value"), e.path());
        return;
    }
    throw std::runtime_error("Unbalanced dict must be rejected");
}

void test_tree_unknown_operator() {
    const std::string text = wrap_statement(
        R"({"kind": "Return", "value": {"kind": "BinOp", "op": "Pow",
            "left": {"kind": "Constant", "value": 2}, "right": {"kind": "Constant", "value": 3}}})");
    std::string msg = AssertHelper::assert_throws<UnsupportedConstruct>([&] { parse_tree(text); });
    AssertHelper::assert_contains(msg, "operator Pow");
}

} // namespace test
} // namespace asmlower
