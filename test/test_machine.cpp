#include "test_helpers.hpp"

namespace asmlower {
namespace test {

namespace {

// def main():
//     xs = [limit, 2]
//     puts("ok\n")
//     return helper(xs[1])
// def helper(v): return v + 1
Module sample_module() {
    return module_of(
        function("main", {}, block(
            assign("xs", list(name("limit"), num(2))),
            expr(call("puts", str("ok\n"))),
            ret(call("helper", subscript(name("xs"), num(1)))))),
        function("helper", {"v"}, block(ret(bin(BinaryOperator::Add, name("v"), num(1))))));
}

} // anonymous namespace

void test_listing_layout() {
    Program program = compile_module(sample_module());
    std::string text = render_listing(program);

    AssertHelper::assert_true(text.rfind("bits 64\ndefault rel\n\nsection .text\n", 0) == 0,
                              "header first\n" + text);
    AssertHelper::assert_contains(text, "global main\n");
    AssertHelper::assert_contains(text, "global helper\n");
    AssertHelper::assert_contains(text, "extern puts\n");
    AssertHelper::assert_not_contains(text, "extern helper", "defined functions are not external");
    AssertHelper::assert_not_contains(text, "_start", "no entry stub by default");

    AssertHelper::assert_order(text, "section .text", "main:\n");
    AssertHelper::assert_order(text, "main:\n", "helper:\n", "units in source order");
    AssertHelper::assert_order(text, "helper:\n", "section .data");
    AssertHelper::assert_contains(text, ": db \"ok\", 10, 0\n");
    AssertHelper::assert_order(text, "section .data", "section .bss\nalignb 8\n");
    AssertHelper::assert_contains(text, "g_limit: resq 1\n");
    AssertHelper::assert_contains(text, "list_0: resq 3\n");
}

void test_listing_entry_stub() {
    Program program = compile_module(sample_module());
    ListingOptions options;
    options.entry = "main";
    std::string text = render_listing(program, options);

    AssertHelper::assert_contains(text, "global _start\n");
    AssertHelper::assert_contains(text, "_start:\n    call main\n    mov rdi, rax\n    mov rax, 60\n    syscall\n");
    AssertHelper::assert_order(text, "_start:", "main:\n", "stub precedes the units");

    options.entry = "missing";
    std::string msg = AssertHelper::assert_throws<std::runtime_error>([&] { render_listing(program, options); });
    AssertHelper::assert_contains(msg, "'missing' is not defined");
}

void test_listing_without_strings() {
    Module m = module_of(function("f", {}, block(ret(num(1)))));
    std::string text = render_listing(compile_module(m));
    AssertHelper::assert_not_contains(text, "section .data", "no string data");
    AssertHelper::assert_contains(text, "section .bss");
}

void test_quote_bytes() {
    AssertHelper::assert_equals(std::string("\"ab\", 10, \"c\", 0"), quote_bytes("ab\nc"));
    AssertHelper::assert_equals(std::string("0"), quote_bytes(""));
    AssertHelper::assert_equals(std::string("\"say \", 34, \"hi\", 34, 0"), quote_bytes("say \"hi\""));
    AssertHelper::assert_equals(std::string("9, \"x\", 0"), quote_bytes("\tx"));
}

void test_machine_data_layout() {
    Program program = compile_module(sample_module());
    Machine machine(program);

    AssertHelper::assert_true(machine.has_symbol("g_limit"), "globals are placed");
    AssertHelper::assert_true(machine.has_symbol("list_0"), "regions are placed");
    AssertHelper::assert_false(machine.has_symbol("helper"), "functions are not data");
    AssertHelper::assert_equals(int64_t(Machine::DATA_BASE), int64_t(machine.symbol_address("g_limit")),
                                "globals come first");
    AssertHelper::assert_equals(0, machine.read_global("limit"));
    AssertHelper::assert_throws<MachineFault>([&] { machine.symbol_address("g_unknown"); });

    const std::string& str_symbol = unit_of(program, "main").data[1].symbol;
    AssertHelper::assert_equals(std::string("ok\n"), machine.read_string(machine.symbol_address(str_symbol)));
}

void test_machine_external_call_faults() {
    Program program = compile_module(sample_module());
    Machine machine(program);
    std::string msg = AssertHelper::assert_throws<MachineFault>([&] { machine.call("main"); });
    AssertHelper::assert_contains(msg, "Machine fault in main");
    AssertHelper::assert_contains(msg, "external symbol 'puts'");
    AssertHelper::assert_equals(3, machine.call("helper", {2}), "machine stays usable after a fault");
}

void test_machine_unknown_function() {
    Program program = compile_module(sample_module());
    Machine machine(program);
    std::string msg = AssertHelper::assert_throws<MachineFault>([&] { machine.call("nope"); });
    AssertHelper::assert_contains(msg, "No function named 'nope'");
}

void test_machine_steps_and_reset() {
    // def f(): xs = [7]; return xs
    Module m = module_of(function("f", {}, block(
        assign("xs", list(num(7))),
        ret(name("xs")))));
    Program program = compile_module(m);
    Machine machine(program);

    uint64_t address = static_cast<uint64_t>(machine.call("f"));
    AssertHelper::assert_true(machine.steps() > 0, "steps counted");
    AssertHelper::assert_equals(7, machine.read_list(address)[0]);

    machine.reset();
    AssertHelper::assert_equals(size_t(0), machine.steps());
    AssertHelper::assert_equals(0, machine.read_word(address), "data zeroed");
}

void test_machine_unmapped_access() {
    Module m = module_of(function("f", {"i"}, block(
        assign("xs", list(num(1))),
        ret(subscript(name("xs"), name("i"))))));
    Program program = compile_module(m);
    Machine machine(program);

    AssertHelper::assert_equals(1, machine.call("f", {0}));
    std::string msg = AssertHelper::assert_throws<MachineFault>([&] { machine.call("f", {100000}); });
    AssertHelper::assert_contains(msg, "unmapped address");
    AssertHelper::assert_throws<MachineFault>([&] { machine.read_word(Machine::DATA_BASE + 4); });
}

void test_machine_stack_overflow() {
    // def down(n): return down(n + 1)
    Module m = module_of(function("down", {"n"}, block(
        ret(call("down", bin(BinaryOperator::Add, name("n"), num(1)))))));
    MachineConfig config;
    config.max_stack_words = 256;
    Program program = compile_module(m);
    Machine machine(program, config);

    std::string msg = AssertHelper::assert_throws<MachineFault>([&] { machine.call("down", {0}); });
    AssertHelper::assert_contains(msg, "stack overflow");
}

} // namespace test
} // namespace asmlower
