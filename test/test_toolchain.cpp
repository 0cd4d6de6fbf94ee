#include "test_helpers.hpp"
#include "al_toolchain.hpp"
#include <filesystem>
#include <fstream>

namespace asmlower {
namespace test {

void test_toolchain_default_commands() {
    std::vector<std::string> commands = default_toolchain_commands();
    AssertHelper::assert_equals(size_t(2), commands.size());
    AssertHelper::assert_contains(commands[0], "nasm -f elf64");
    AssertHelper::assert_contains(commands[1], "ld {object} -o {output}");
}

void test_toolchain_expand_command() {
    std::string cmd = expand_command("nasm -f elf64 {input} -o {object} && cp {object} {output}",
                                     "/tmp/a b/program.asm", "/tmp/it's/program.o", "/tmp/out");
    AssertHelper::assert_equals(
        std::string("nasm -f elf64 '/tmp/a b/program.asm' -o '/tmp/it'\\''s/program.o' && "
                    "cp '/tmp/it'\\''s/program.o' '/tmp/out'"),
        cmd);
}

void test_toolchain_build_hands_over_binary() {
    Toolchain toolchain(std::vector<std::string>{"cp {input} {object}", "cp {object} {output}"});
    std::filesystem::path seen;
    std::string contents;

    toolchain.build("bits 64\n", [&](const std::filesystem::path& binary) {
        seen = binary;
        std::ifstream in(binary, std::ios::binary);
        contents.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    });

    AssertHelper::assert_equals(std::string("bits 64\n"), contents);
    AssertHelper::assert_false(seen.empty(), "callback saw the binary");
    AssertHelper::assert_false(std::filesystem::exists(seen), "scratch files removed after build");
    AssertHelper::assert_false(std::filesystem::exists(seen.parent_path()), "scratch directory removed");
}

void test_toolchain_failure_reports_diagnostics() {
    Toolchain toolchain(std::vector<std::string>{"sh -c 'echo boom; exit 3'", "cp {input} {output}"});
    try {
        toolchain.build("bits 64\n", nullptr);
    } catch (const ToolchainFailure& e) {
        AssertHelper::assert_equals(int64_t(3), int64_t(e.exit_code()));
        AssertHelper::assert_contains(e.diagnostics(), "boom");
        AssertHelper::assert_contains(e.command(), "exit 3");
        AssertHelper::assert_contains(e.what(), "exit 3");
        return;
    }
    throw std::runtime_error("Failing command must raise ToolchainFailure");
}

void test_toolchain_missing_binary() {
    Toolchain toolchain(std::vector<std::string>{"true"});
    bool called = false;
    std::string msg = AssertHelper::assert_throws<ToolchainFailure>([&] {
        toolchain.build("bits 64\n", [&](const std::filesystem::path&) { called = true; });
    });
    AssertHelper::assert_contains(msg, "no binary was produced");
    AssertHelper::assert_false(called, "callback not invoked without a binary");
}

void test_toolchain_requires_commands() {
    AssertHelper::assert_throws<std::invalid_argument>([] { Toolchain toolchain(std::vector<std::string>{}); });
}

void test_temp_artifacts_cleanup() {
    std::filesystem::path dir;
    {
        TempArtifacts artifacts;
        dir = artifacts.dir();
        AssertHelper::assert_true(std::filesystem::is_directory(dir), "directory created");
        std::ofstream(artifacts.input()) << "x";
        AssertHelper::assert_equals(std::string("program.asm"), artifacts.input().filename().string());
    }
    AssertHelper::assert_false(std::filesystem::exists(dir), "directory removed with its files");

    TempArtifacts a;
    TempArtifacts b;
    AssertHelper::assert_true(a.dir() != b.dir(), "each build gets its own directory");
}

} // namespace test
} // namespace asmlower
