//! # External Parser Tests
//!
//! Drives SyntaxTreeParser and run_process against small shell scripts that
//! stand in for the compiler.

#include "syntax/parser.hpp"
#include "syntax/process.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <optional>
#include <string>

using namespace lth;
using namespace lth::syntax;
using namespace lth::test;

namespace {

/// Replaces PATH for the lifetime of the guard.
class PathGuard {
public:
    explicit PathGuard(const std::string& path) {
        if (const char* old = std::getenv("PATH")) {
            saved_ = old;
        }
        setenv("PATH", path.c_str(), 1);
    }

    ~PathGuard() {
        if (saved_) {
            setenv("PATH", saved_->c_str(), 1);
        } else {
            unsetenv("PATH");
        }
    }

private:
    std::optional<std::string> saved_;
};

} // namespace

// ============================================================================
// run_process
// ============================================================================

TEST(RunProcessTest, CapturesBothStreamsAndExitCode) {
    TempDir dir;
    auto script = dir.file("tool");
    write_script(script, "echo \"out $1\"\necho \"err $2\" >&2\nexit 3\n");

    auto result = run_process(script, {"a", "b"});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
    EXPECT_EQ(unwrap(result).exit_code, 3);
    EXPECT_EQ(unwrap(result).stdout_output, "out a\n");
    EXPECT_EQ(unwrap(result).stderr_output, "err b\n");
}

TEST(RunProcessTest, LargeOutputOnBothStreamsDoesNotBlock) {
    TempDir dir;
    auto script = dir.file("noisy");
    write_script(script, "i=0\nwhile [ $i -lt 2000 ]; do\n"
                         "  echo \"................................................................\"\n"
                         "  echo \"................................................................\" >&2\n"
                         "  i=$((i+1))\ndone\n");

    auto result = run_process(script, {});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
    EXPECT_EQ(unwrap(result).exit_code, 0);
    EXPECT_EQ(unwrap(result).stdout_output.size(), 2000u * 65u);
    EXPECT_EQ(unwrap(result).stderr_output.size(), 2000u * 65u);
}

TEST(RunProcessTest, RejectsNonExecutable) {
    TempDir dir;
    auto plain = dir.file("plain.txt");
    write_text(plain, "not a program");

    auto result = run_process(plain, {});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "'" + plain + "' is not an executable file");

    EXPECT_TRUE(is_err(run_process(dir.path().string(), {})));
}

TEST(FindInPathTest, SearchesEachDirectory) {
    TempDir first;
    TempDir second;
    write_script(second.file("swiftc"), "exit 0\n");

    PathGuard guard(first.path().string() + ":" + second.path().string());
    auto found = find_in_path("swiftc");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, second.file("swiftc"));
    EXPECT_FALSE(find_in_path("no-such-tool-here").has_value());
}

// ============================================================================
// SyntaxTreeParser
// ============================================================================

class SyntaxTreeParserTest : public ::testing::Test {
protected:
    TempDir dir;
    std::string source;
    std::string tree;

    void SetUp() override {
        source = dir.file("input.swift");
        tree = dir.file("tree.json");
        write_text(source, "let x = 1");
        write_text(tree, let_decl_json());
    }

    /// A compiler that checks its arguments and prints `tree.json`.
    auto fake_compiler() -> std::string {
        auto path = dir.file("swiftc");
        write_script(path, "if [ \"$1\" != \"-frontend\" ] || [ \"$2\" != \"-emit-syntax\" ]; then\n"
                           "  echo \"unexpected arguments: $*\" >&2\n"
                           "  exit 2\n"
                           "fi\n"
                           "cat \"" + tree + "\"\n");
        return path;
    }
};

TEST_F(SyntaxTreeParserTest, ParsesCompilerOutput) {
    auto result = SyntaxTreeParser::parse(source, fake_compiler());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
    EXPECT_EQ(source_text(*unwrap(result)), "let x = 1");
}

TEST_F(SyntaxTreeParserTest, FindsCompilerOnPath) {
    fake_compiler();
    PathGuard guard(dir.path().string());

    auto resolved = SyntaxTreeParser::resolve_compiler(std::nullopt);
    ASSERT_TRUE(is_ok(resolved));
    EXPECT_EQ(unwrap(resolved), dir.file("swiftc"));

    auto result = SyntaxTreeParser::parse(source);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
}

TEST_F(SyntaxTreeParserTest, ExplicitCompilerWins) {
    auto resolved = SyntaxTreeParser::resolve_compiler(std::string("/opt/swift/bin/swiftc"));
    ASSERT_TRUE(is_ok(resolved));
    EXPECT_EQ(unwrap(resolved), "/opt/swift/bin/swiftc");
}

TEST_F(SyntaxTreeParserTest, CompilerMissingFromPath) {
    TempDir empty;
    PathGuard guard(empty.path().string());

    auto result = SyntaxTreeParser::parse(source);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "unable to find 'swiftc' on PATH; pass -swiftc <path>");
}

TEST_F(SyntaxTreeParserTest, CompilerFailureCarriesDiagnostics) {
    auto compiler = dir.file("broken");
    write_script(compiler, "echo \"error: expected expression\" >&2\nexit 1\n");

    auto result = SyntaxTreeParser::parse(source, compiler);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "'" + compiler + "' failed to parse '" + source +
                                              "' (exit code 1):\nerror: expected expression\n");
}

TEST_F(SyntaxTreeParserTest, UnreadableCompilerOutput) {
    auto compiler = dir.file("garbage");
    write_script(compiler, "echo 'not a tree'\n");

    auto result = SyntaxTreeParser::parse(source, compiler);
    ASSERT_TRUE(is_err(result));
    auto prefix = "'" + compiler + "' produced an unreadable syntax tree: invalid JSON syntax tree";
    EXPECT_EQ(unwrap_err(result).message.rfind(prefix, 0), 0u) << unwrap_err(result).message;
}

TEST_F(SyntaxTreeParserTest, CompilerThatIsNotExecutable) {
    auto result = SyntaxTreeParser::parse(source, tree);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message,
              "failed to run '" + tree + "': '" + tree + "' is not an executable file");
}

TEST_F(SyntaxTreeParserTest, MissingSourceFile) {
    auto missing = dir.file("absent.swift");
    auto result = SyntaxTreeParser::parse(missing, fake_compiler());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "cannot read source file '" + missing + "'");
}
