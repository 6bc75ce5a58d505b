/// @file test_writer.cpp
/// @brief Unit tests for the document writer (compact, pretty, escaping, streams).

#include <seqdict/seqdict.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

using namespace seqdict;

// ═══════════════════════════════════════════════════════════════════════════════
// Scalars
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Writer, Literals) {
    EXPECT_EQ(write(Node()), "null");
    EXPECT_EQ(write(Node(true)), "true");
    EXPECT_EQ(write(Node(false)), "false");
}

TEST(Writer, Integers) {
    EXPECT_EQ(write(Node(0)), "0");
    EXPECT_EQ(write(Node(-42)), "-42");
    EXPECT_EQ(write(Node(std::numeric_limits<int64_t>::min())), "-9223372036854775808");
    EXPECT_EQ(write(Node(UINT64_MAX)), "18446744073709551615");
}

TEST(Writer, FloatsStayFloats) {
    EXPECT_EQ(write(Node(1.0)), "1.0");
    EXPECT_EQ(write(Node(0.5)), "0.5");
    EXPECT_EQ(write(Node(-2.25)), "-2.25");
}

TEST(Writer, NonFiniteFloatsBecomeNull) {
    EXPECT_EQ(write(Node(std::numeric_limits<double>::quiet_NaN())), "null");
    EXPECT_EQ(write(Node(std::numeric_limits<double>::infinity())), "null");
}

TEST(Writer, StringEscaping) {
    EXPECT_EQ(write(Node("plain")), "\"plain\"");
    EXPECT_EQ(write(Node("a\"b")), "\"a\\\"b\"");
    EXPECT_EQ(write(Node("a\\b")), "\"a\\\\b\"");
    EXPECT_EQ(write(Node("line\nnext\ttab")), "\"line\\nnext\\ttab\"");
    EXPECT_EQ(write(Node(std::string("\x01", 1))), "\"\\u0001\"");
    EXPECT_EQ(write(Node(std::string("\0", 1))), "\"\\u0000\"");
}

TEST(Writer, Utf8PassesThrough) {
    EXPECT_EQ(write(Node("\xC3\xA9")), "\"\xC3\xA9\"");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Containers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Writer, CompactContainers) {
    EXPECT_EQ(write(Node::array()), "[]");
    EXPECT_EQ(write(Node::object()), "{}");

    Node n(Object{{"a", 1}, {"b", Node(Array{Node(1), Node("x"), Node()})}});
    EXPECT_EQ(write(n), R"({"a":1,"b":[1,"x",null]})");
}

TEST(Writer, ObjectKeepsInsertionOrder) {
    Node n = Node::object();
    n["z"] = 1;
    n["a"] = 2;
    EXPECT_EQ(write(n), R"({"z":1,"a":2})");
}

TEST(Writer, PrettyPrint) {
    Node n(Object{{"a", Node(Array{Node(1), Node(2)})}, {"b", Node::object()}});
    WriteOptions opts;
    opts.indent = 2;
    const std::string expected =
        "{\n"
        "  \"a\": [\n"
        "    1,\n"
        "    2\n"
        "  ],\n"
        "  \"b\": {}\n"
        "}";
    EXPECT_EQ(write(n, opts), expected);
}

TEST(Writer, PrettyZeroIndentStillBreaksLines) {
    WriteOptions opts;
    opts.indent = 0;
    EXPECT_EQ(write(Node(Array{Node(1), Node(2)}), opts), "[\n1,\n2\n]");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Streams
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Writer, StreamMatchesString) {
    Node n(Object{{"k", "v"}, {"n", Node(Array{Node(1.5), Node(false)})}});
    std::ostringstream os;
    write(os, n);
    EXPECT_EQ(os.str(), write(n));
}

TEST(Writer, StreamOperator) {
    std::ostringstream os;
    os << Node(Array{Node(1), Node(2)});
    EXPECT_EQ(os.str(), "[1,2]");
}

TEST(Writer, LargeDocumentToStream) {
    Node arr = Node::array();
    for (int i = 0; i < 5000; ++i) arr.push_back(std::string(10, 'x'));
    std::ostringstream os;
    write(os, arr);
    EXPECT_EQ(os.str(), write(arr));
    EXPECT_EQ(read(os.str()).size(), 5000u);
}
