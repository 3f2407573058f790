#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "exec_kernel/syntax_validator.h"

using namespace exec_kernel;

namespace {

SyntaxCheck check(const std::string& code) {
    static const PythonSyntaxValidator validator;
    return validator.check(code);
}

} // anonymous namespace

TEST(PythonSyntaxValidatorTest, AcceptsOrdinaryPrograms) {
    EXPECT_TRUE(check("print(\"4\")").valid);
    EXPECT_TRUE(check("").valid);
    EXPECT_TRUE(check("# only a comment\n").valid);
    EXPECT_TRUE(check(
        "import math\n"
        "\n"
        "def area(r: float) -> float:\n"
        "    \"\"\"Circle area.\n"
        "    Spans lines: (unbalanced [ inside a docstring is fine\n"
        "    \"\"\"\n"
        "    return math.pi * r ** 2\n"
        "\n"
        "class Shape:\n"
        "    sides = {'square': 4, 'triangle': 3}\n"
        "\n"
        "    def __init__(self, name):\n"
        "        self.name = name\n"
        "\n"
        "for i in range(3):\n"
        "    if i % 2 == 0:\n"
        "        print(i, area(i))\n"
        "    else:\n"
        "        pass\n").valid);
}

TEST(PythonSyntaxValidatorTest, AcceptsImplicitAndExplicitContinuation) {
    EXPECT_TRUE(check("x = (1 +\n     2)\nprint(x)\n").valid);
    EXPECT_TRUE(check("x = 1 + \\\n    2\n").valid);
    EXPECT_TRUE(check("values = [\n    1,\n  2,\n        3,\n]\n").valid);
}

TEST(PythonSyntaxValidatorTest, AcceptsOneLineCompoundStatements) {
    EXPECT_TRUE(check("if True: print('yes')\n").valid);
    EXPECT_TRUE(check("class Empty: pass\n").valid);
    EXPECT_TRUE(check("f = lambda x: x + 1\n").valid);
    EXPECT_TRUE(check("count: int = 3\n").valid);
    EXPECT_TRUE(check("print(xs[1:2])\n").valid);
}

TEST(PythonSyntaxValidatorTest, AcceptsWalrusAndSoftKeywords) {
    EXPECT_TRUE(check("if (n := 10) > 5:\n    print(n)\n").valid);
    EXPECT_TRUE(check("match = 3\nprint(match)\n").valid);
    EXPECT_TRUE(check("match command:\n    case 'go':\n        pass\n").valid);
}

TEST(PythonSyntaxValidatorTest, AcceptsStringPrefixesAndEscapes) {
    EXPECT_TRUE(check("s = r'\\d+'\nb = b\"bytes\"\nf = f'{1 + 1}'\n").valid);
    EXPECT_TRUE(check("s = 'it\\'s'\n").valid);
    EXPECT_TRUE(check("s = '''a\nb'''\n").valid);
}

TEST(PythonSyntaxValidatorTest, AcceptsWindowsLineEndings) {
    EXPECT_TRUE(check("if True:\r\n    print(1)\r\n").valid);
}

TEST(PythonSyntaxValidatorTest, ReportsUnclosedBracketAtItsPosition) {
    SyntaxCheck r = check("x = 1\nprint(\n");
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.message, "'(' was never closed");
    EXPECT_EQ(r.line, 2);
    EXPECT_EQ(r.column, 6);
    EXPECT_EQ(r.describe(), "Syntax error at line 2: '(' was never closed");
}

TEST(PythonSyntaxValidatorTest, ReportsUnmatchedAndMismatchedBrackets) {
    SyntaxCheck unmatched = check("print(1))\n");
    ASSERT_FALSE(unmatched.valid);
    EXPECT_EQ(unmatched.message, "unmatched ')'");

    SyntaxCheck mismatched = check("x = [1, 2)\n");
    ASSERT_FALSE(mismatched.valid);
    EXPECT_EQ(mismatched.message, "closing parenthesis ')' does not match opening parenthesis '['");
}

TEST(PythonSyntaxValidatorTest, ReportsMissingColon) {
    SyntaxCheck r = check("if x > 1\n    print(x)\n");
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.message, "expected ':'");
    EXPECT_EQ(r.line, 1);
}

TEST(PythonSyntaxValidatorTest, ReportsMissingIndentedBlock) {
    SyntaxCheck r = check("def f():\nreturn 1\n");
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.message, "expected an indented block after 'def' statement on line 1");
    EXPECT_EQ(r.line, 2);

    SyntaxCheck at_eof = check("for i in range(3):\n");
    ASSERT_FALSE(at_eof.valid);
    EXPECT_EQ(at_eof.message, "expected an indented block after 'for' statement on line 1");
}

TEST(PythonSyntaxValidatorTest, ReportsIndentationErrors) {
    SyntaxCheck unexpected = check("x = 1\n    y = 2\n");
    ASSERT_FALSE(unexpected.valid);
    EXPECT_EQ(unexpected.message, "unexpected indent");
    EXPECT_EQ(unexpected.line, 2);

    SyntaxCheck dedent = check("if True:\n    x = 1\n  y = 2\n");
    ASSERT_FALSE(dedent.valid);
    EXPECT_EQ(dedent.message, "unindent does not match any outer indentation level");
    EXPECT_EQ(dedent.line, 3);
}

TEST(PythonSyntaxValidatorTest, ReportsInconsistentTabs) {
    SyntaxCheck r = check("if True:\n        x = 1\n\ty = 2\n");
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.message, "inconsistent use of tabs and spaces in indentation");
}

TEST(PythonSyntaxValidatorTest, ReportsUnterminatedStrings) {
    SyntaxCheck single = check("s = 'abc\nprint(s)\n");
    ASSERT_FALSE(single.valid);
    EXPECT_EQ(single.message, "unterminated string literal (detected at line 1)");
    EXPECT_EQ(single.line, 1);

    SyntaxCheck triple = check("s = \"\"\"abc\n\nprint(s)\n");
    ASSERT_FALSE(triple.valid);
    EXPECT_NE(triple.message.find("unterminated triple-quoted string literal"), std::string::npos);
}

TEST(PythonSyntaxValidatorTest, ReportsStrayCharacters) {
    EXPECT_EQ(check("x = $y\n").message, "invalid syntax");
    EXPECT_EQ(check("x = y?\n").message, "invalid syntax");
    EXPECT_EQ(check("x = !y\n").message, "invalid syntax");
    EXPECT_TRUE(check("x = 1 != 2\n").valid);
    EXPECT_EQ(check("x = 1 \\ 2\n").message, "unexpected character after line continuation character");
}

TEST(PythonSyntaxValidatorTest, ReportsColonOnSimpleStatement) {
    SyntaxCheck r = check("print('x'):\n");
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.message, "invalid syntax");
}

TEST(PythonSyntaxValidatorTest, RejectsNullBytes) {
    std::string code = "x = 1\ny = 2";
    code += '\0';
    SyntaxCheck r = check(code);
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.message, "source code cannot contain null bytes");
    EXPECT_EQ(r.line, 2);
}

TEST(PythonSyntaxValidatorTest, BoundsNestingDepth) {
    PythonSyntaxValidator shallow(10);
    std::string deep = "x = " + std::string(11, '(') + "1" + std::string(11, ')') + "\n";
    SyntaxCheck r = shallow.check(deep);
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.message, "too many nested parentheses");

    std::string ok = "x = " + std::string(10, '(') + "1" + std::string(10, ')') + "\n";
    EXPECT_TRUE(shallow.check(ok).valid);
}

TEST(PythonSyntaxValidatorTest, RejectsGrammarErrors) {
    const char* const broken[] = {
        "x = = 1",
        "print(1 +)",
        "1 = x",
        "if x pass:\n    y",
        "for in range(3):\n    pass",
        "def f(:\n    pass\n",
        "return return\n",
        "import\n",
    };
    for (const char* code : broken) {
        SyntaxCheck r = check(code);
        EXPECT_FALSE(r.valid) << code;
        EXPECT_GE(r.line, 1) << code;
    }
}

TEST(PythonSyntaxValidatorTest, GrammarErrorsCarryPosition) {
    SyntaxCheck r = check("x = 1\ny = = 2\n");
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.message, "invalid syntax");
    EXPECT_EQ(r.line, 2);
    EXPECT_EQ(r.column, 5);

    SyntaxCheck literal = check("1 = x");
    ASSERT_FALSE(literal.valid);
    EXPECT_EQ(literal.message.rfind("cannot assign to literal", 0), 0u) << literal.message;
    EXPECT_EQ(literal.describe().rfind("Syntax error at line 1: ", 0), 0u);
}

TEST(PythonSyntaxValidatorTest, ParserIsSafeFromManyThreads) {
    std::vector<std::thread> workers;
    std::atomic<int> wrong{0};
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&] {
            for (int j = 0; j < 50; ++j) {
                if (!check("total = sum(x * x for x in range(10))\n").valid) ++wrong;
                if (check("total = = 1\n").valid) ++wrong;
            }
        });
    }
    for (auto& t : workers) t.join();
    EXPECT_EQ(wrong.load(), 0);
}

TEST(PythonSyntaxValidatorTest, DescribesValidResult) {
    EXPECT_EQ(SyntaxCheck::ok().describe(), "valid");
    EXPECT_EQ(PythonSyntaxValidator().language(), "python");
}
