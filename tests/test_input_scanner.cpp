#include <gtest/gtest.h>
#include <managers/input_scanner.hpp>
#include <core/utils.hpp>
#include <fstream>

namespace fs = std::filesystem;

TEST(InputScannerTest, FindsCallsInOrder) {
    auto inputs = scan_python_inputs(
        "name = input('Your name: ')\n"
        "age = int(input(\"Age? \"))\n");
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0].index, 1);
    EXPECT_EQ(*inputs[0].prompt, "Your name: ");
    EXPECT_EQ(inputs[1].index, 2);
    EXPECT_EQ(*inputs[1].prompt, "Age? ");
}

TEST(InputScannerTest, NonLiteralPromptIsUnknown) {
    auto inputs = scan_python_inputs(
        "x = input(prompt)\n"
        "y = input()\n"
        "z = input(f'Hi {name}')\n"
        "w = input('a' + b)\n");
    ASSERT_EQ(inputs.size(), 4u);
    for (const auto& in : inputs) EXPECT_FALSE(in.prompt.has_value());
}

TEST(InputScannerTest, JoinsAdjacentLiterals) {
    auto inputs = scan_python_inputs("v = input('Enter '\n  \"value: \")\n");
    ASSERT_EQ(inputs.size(), 1u);
    EXPECT_EQ(*inputs[0].prompt, "Enter value: ");
}

TEST(InputScannerTest, HandlesEscapesAndTripleQuotes) {
    auto inputs = scan_python_inputs(
        "a = input('it\\'s: ')\n"
        "b = input(\"\"\"multi\nline\"\"\")\n");
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(*inputs[0].prompt, "it's: ");
    EXPECT_EQ(*inputs[1].prompt, "multi\nline");
}

TEST(InputScannerTest, IgnoresCommentsStringsAndMethods) {
    auto inputs = scan_python_inputs(
        "# input('commented')\n"
        "s = \"input('in a string')\"\n"
        "doc = '''input(\"docstring\")'''\n"
        "obj.input('method')\n"
        "def input(prompt):\n"
        "    return 'x'\n"
        "my_input('other')\n");
    EXPECT_TRUE(inputs.empty());
}

TEST(InputScannerTest, NestedCallInArgument) {
    auto inputs = scan_python_inputs("x = input(input('inner'))\n");
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_FALSE(inputs[0].prompt.has_value());
    EXPECT_EQ(*inputs[1].prompt, "inner");
}

TEST(InputScannerTest, OnlyPythonFilesAreScanned) {
    fs::path dir = fs::temp_directory_path() / ("jobcast_scanner_test_" + generate_uuid());
    fs::create_directories(dir);
    std::ofstream(dir / "a.py") << "input('Name')\n";
    std::ofstream(dir / "b.sh") << "input('Name')\n";

    auto py = scan_script_inputs(dir / "a.py");
    ASSERT_EQ(py.size(), 1u);
    EXPECT_EQ(*py[0].prompt, "Name");
    EXPECT_TRUE(scan_script_inputs(dir / "b.sh").empty());
    EXPECT_TRUE(scan_script_inputs(dir / "missing.py").empty());

    fs::remove_all(dir);
}

TEST(InputScannerTest, InvalidSourceReportsNothing) {
    EXPECT_TRUE(scan_python_inputs("name = input('Name: '\n").empty());
    EXPECT_TRUE(scan_python_inputs("a = input('ok')\nb = 'unterminated\n").empty());
    EXPECT_TRUE(scan_python_inputs("a = input('ok')\ns = \"\"\"never closed\n").empty());
    EXPECT_TRUE(scan_python_inputs("a = input('ok'))\n").empty());
    EXPECT_TRUE(scan_python_inputs("x = [input('ok')\n").empty());
}

TEST(InputScannerTest, BracketsInsideStringsAndCommentsAreIgnored) {
    auto inputs = scan_python_inputs(
        "# unbalanced ( in a comment\n"
        "s = ')]}'\n"
        "v = input('Pick [a/b]: ')\n"
        "d = {'k': [1, (2, 3)]}\n");
    ASSERT_EQ(inputs.size(), 1u);
    EXPECT_EQ(*inputs[0].prompt, "Pick [a/b]: ");
}
