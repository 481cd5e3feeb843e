#include <gtest/gtest.h>

#include "src/server/precheck.h"

using namespace aiexec;

namespace {

bool Contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST(IdentifierTest, AcceptsPlainIdentifiersOnly) {
    EXPECT_TRUE(IsIdentifier("run"));
    EXPECT_TRUE(IsIdentifier("_solve2"));
    EXPECT_FALSE(IsIdentifier(""));
    EXPECT_FALSE(IsIdentifier("2run"));
    EXPECT_FALSE(IsIdentifier("run()"));
    EXPECT_FALSE(IsIdentifier("os.system"));
    EXPECT_FALSE(IsIdentifier(std::string(129, 'a')));
}

TEST(PythonScanTest, AcceptsWellFormedModule) {
    const std::string source =
        "def helper(x):\n"
        "    return [x,\n"
        "            x * 2]  # trailing comment (\n"
        "\n"
        "async def run(a, b=3):\n"
        "    text = '''multi\n"
        "line ( string'''\n"
        "    if a:\n"
        "        return helper(a)\n"
        "    return rb'raw' + b\"x\"\n";
    EXPECT_TRUE(ScanPythonSource(source, "run").empty());
}

TEST(PythonScanTest, EntryBoundByAssignmentCounts) {
    EXPECT_TRUE(ScanPythonSource("run = lambda: 42\n", "run").empty());
    EXPECT_TRUE(ScanPythonSource("class run:\n    pass\n", "run").empty());
}

TEST(PythonScanTest, ReportsMissingEntryPoint) {
    auto diagnostics = ScanPythonSource("def other():\n    return 1\n", "run");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].line, 0);
    EXPECT_TRUE(Contains(diagnostics[0].message, "'run'"));
}

TEST(PythonScanTest, NestedDefinitionIsNotTheEntryPoint) {
    auto diagnostics = ScanPythonSource("def outer():\n    def run():\n        return 1\n", "run");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].line, 0);
}

TEST(PythonScanTest, ReportsUnclosedBracket) {
    auto diagnostics = ScanPythonSource("def run():\n    return (1 +\n", "run");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].line, 2);
    EXPECT_EQ(diagnostics[0].column, 12);
    EXPECT_TRUE(Contains(diagnostics[0].message, "was never closed"));
}

TEST(PythonScanTest, ReportsMismatchedBracket) {
    auto diagnostics = ScanPythonSource("def run():\n    return [1, 2)\n", "run");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].line, 2);
    EXPECT_TRUE(Contains(diagnostics[0].message, "does not match"));
}

TEST(PythonScanTest, ReportsUnterminatedString) {
    auto diagnostics = ScanPythonSource("def run():\n    return 'abc\n", "run");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].line, 2);
    EXPECT_EQ(diagnostics[0].message, "unterminated string literal");

    auto triple = ScanPythonSource("def run():\n    return \"\"\"abc\n", "run");
    ASSERT_EQ(triple.size(), 1u);
    EXPECT_EQ(triple[0].message, "unterminated triple-quoted string literal");
}

TEST(PythonScanTest, ReportsIndentationErrors) {
    auto unexpected = ScanPythonSource("x = 1\n    y = 2\ndef run():\n    return y\n", "run");
    ASSERT_EQ(unexpected.size(), 1u);
    EXPECT_EQ(unexpected[0].line, 2);
    EXPECT_EQ(unexpected[0].message, "unexpected indent");

    auto missing = ScanPythonSource("def run():\nreturn 1\n", "run");
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].line, 2);
    EXPECT_EQ(missing[0].message, "expected an indented block");

    auto dedent = ScanPythonSource("def run():\n        x = 1\n    return x\n", "run");
    ASSERT_EQ(dedent.size(), 1u);
    EXPECT_EQ(dedent[0].line, 3);
    EXPECT_EQ(dedent[0].message, "unindent does not match any outer indentation level");

    auto mixed = ScanPythonSource("def run():\n\tx = 1\n        return x\n", "run");
    ASSERT_EQ(mixed.size(), 1u);
    EXPECT_EQ(mixed[0].line, 3);
    EXPECT_EQ(mixed[0].message, "inconsistent use of tabs and spaces in indentation");
}

TEST(PythonScanTest, ReportsTrailingColonWithoutBody) {
    auto diagnostics = ScanPythonSource("def run():\n", "run");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].message, "expected an indented block");
}

TEST(CppScanTest, AcceptsWellFormedTranslationUnit) {
    const std::string source =
        "#include <vector>\n"
        "#include <string>\n"
        "// main( in a comment\n"
        "/* run( too */\n"
        "static int helper(int x) { return x * 2; }\n"
        "const char* text = \"main(\";\n"
        "const char* raw = R\"x(a \" ) ( b)x\";\n"
        "long big = 1'000'000;\n"
        "int run(const std::vector<std::string>& args) {\n"
        "    return helper(static_cast<int>(args.size()));\n"
        "}\n";
    EXPECT_TRUE(ScanCppSource(source, "run").empty());
}

TEST(CppScanTest, RejectsMainDefinition) {
    auto diagnostics = ScanCppSource("int run() { return 1; }\nint main() { return run(); }\n", "run");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].line, 2);
    EXPECT_EQ(diagnostics[0].column, 5);
    EXPECT_TRUE(Contains(diagnostics[0].message, "main"));
}

TEST(CppScanTest, RejectsNonSystemIncludes) {
    auto quoted = ScanCppSource("#include \"secrets.h\"\nint run() { return 1; }\n", "run");
    ASSERT_EQ(quoted.size(), 1u);
    EXPECT_EQ(quoted[0].line, 1);

    auto absolute = ScanCppSource("#include </etc/passwd>\nint run() { return 1; }\n", "run");
    ASSERT_EQ(absolute.size(), 1u);
    EXPECT_EQ(absolute[0].message, "include path must name a system header");

    auto relative = ScanCppSource("#include <../../etc/shadow>\nint run() { return 1; }\n", "run");
    ASSERT_EQ(relative.size(), 1u);

    auto computed = ScanCppSource("#define H <vector>\n#include H\nint run() { return 1; }\n", "run");
    ASSERT_EQ(computed.size(), 1u);
    EXPECT_EQ(computed[0].line, 2);
    EXPECT_EQ(computed[0].message, "computed #include directives are not allowed");
}

TEST(CppScanTest, ReportsUnterminatedConstructs) {
    auto comment = ScanCppSource("int run() { return 1; }\n/* never closed\n", "run");
    ASSERT_EQ(comment.size(), 1u);
    EXPECT_EQ(comment[0].line, 2);
    EXPECT_EQ(comment[0].message, "unterminated comment");

    auto raw = ScanCppSource("int run() { return 1; }\nauto s = R\"x(abc)y\";\n", "run");
    ASSERT_EQ(raw.size(), 1u);
    EXPECT_EQ(raw[0].message, "unterminated raw string");

    auto brace = ScanCppSource("int run() {\n    return 1;\n", "run");
    ASSERT_EQ(brace.size(), 1u);
    EXPECT_EQ(brace[0].line, 1);
    EXPECT_EQ(brace[0].column, 11);
}

TEST(CppScanTest, ReportsMissingEntryPoint) {
    auto diagnostics = ScanCppSource("int helper() { return 1; }\n", "run");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].line, 0);
    EXPECT_EQ(diagnostics[0].message, "no top-level function named 'run'");
}

TEST(ToolDiagnosticsTest, KeepsErrorsForTheLabelledFileOnly) {
    const std::string output =
        "In file included from <stdin>:1:\n"
        "submission.cpp:3:7: error: expected ';' before '}' token\n"
        "submission.cpp:3:7: note: some note\n"
        "submission.cpp:4:1: warning: unused variable\n"
        "aiexec_harness.cpp:12:5: error: no matching function\n"
        "submission.cpp:9:10: fatal error: missing.h: No such file or directory\n";
    auto diagnostics = ParseToolDiagnostics(output, "submission.cpp");
    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics[0].line, 3);
    EXPECT_EQ(diagnostics[0].column, 7);
    EXPECT_EQ(diagnostics[0].message, "expected ';' before '}' token");
    EXPECT_EQ(diagnostics[1].line, 9);
    EXPECT_EQ(diagnostics[1].message, "missing.h: No such file or directory");
}

TEST(ToolDiagnosticsTest, FormatsWithPosition) {
    EXPECT_EQ(FormatDiagnostic(Diagnostic{2, 5, "invalid syntax"}), "line 2, column 5: invalid syntax");
    EXPECT_EQ(FormatDiagnostic(Diagnostic{0, 0, "no entry"}), "no entry");
}
