/// @file test_conversion.cpp
/// @brief Unit tests for to_node/from_node conversions and user-type ADL hooks.

#include <seqdict/seqdict.hpp>

#include <gtest/gtest.h>

#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace seqdict;

namespace game {

struct Stats {
    int hp = 0;
    int mp = 0;
    bool operator==(const Stats& o) const { return hp == o.hp && mp == o.mp; }
};

inline void to_node(seqdict::Node& n, const Stats& s) {
    n = seqdict::Node::object();
    n["hp"] = s.hp;
    n["mp"] = s.mp;
}

inline void from_node(const seqdict::Node& n, Stats& s) {
    s.hp = static_cast<int>(n["hp"].as_integer());
    s.mp = static_cast<int>(n["mp"].as_integer());
}

} // namespace game

// ═══════════════════════════════════════════════════════════════════════════════
// Built-in types
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Conversion, Primitives) {
    EXPECT_EQ(to_document(42), Node(42));
    EXPECT_EQ(to_document(true), Node(true));
    EXPECT_EQ(to_document(std::string("s")), Node("s"));
    EXPECT_EQ(to_document(2.5f), Node(2.5));

    EXPECT_EQ(from_document<int>(Node(42)), 42);
    EXPECT_EQ(from_document<unsigned>(Node(7)), 7u);
    EXPECT_EQ(from_document<uint64_t>(Node(UINT64_MAX)), UINT64_MAX);
    EXPECT_FLOAT_EQ(from_document<float>(Node(0.5)), 0.5f);
    EXPECT_DOUBLE_EQ(from_document<double>(Node(3)), 3.0);
    EXPECT_EQ(from_document<std::string>(Node("abc")), "abc");
    EXPECT_TRUE(from_document<bool>(Node(true)));
}

TEST(Conversion, WrongTypeThrows) {
    EXPECT_THROW((void)from_document<int>(Node("x")), TypeError);
    EXPECT_THROW((void)from_document<std::string>(Node(1)), TypeError);
    EXPECT_THROW((void)from_document<std::vector<int>>(Node(1)), TypeError);
}

TEST(Conversion, NarrowingOutOfRangeThrows) {
    EXPECT_EQ(from_document<int>(Node(int64_t{INT_MIN})), INT_MIN);
    EXPECT_EQ(from_document<int>(Node(int64_t{INT_MAX})), INT_MAX);
    EXPECT_THROW((void)from_document<int>(Node(int64_t{INT_MAX} + 1)), TypeError);
    EXPECT_THROW((void)from_document<int>(Node(int64_t{4294967297})), TypeError);

    EXPECT_EQ(from_document<unsigned>(Node(uint64_t{UINT_MAX})), UINT_MAX);
    EXPECT_THROW((void)from_document<unsigned>(Node(uint64_t{UINT_MAX} + 1)), TypeError);
    EXPECT_THROW((void)from_document<unsigned>(Node(-1)), TypeError);

    EXPECT_FLOAT_EQ(from_document<float>(Node(1.0e38)), 1.0e38f);
    EXPECT_THROW((void)from_document<float>(Node(1.0e300)), TypeError);
    EXPECT_THROW((void)from_document<float>(Node(-1.0e300)), TypeError);
}

TEST(Conversion, Vector) {
    std::vector<int> v{1, 2, 3};
    Node n = to_document(v);
    ASSERT_TRUE(n.is_array());
    EXPECT_EQ(write(n), "[1,2,3]");
    EXPECT_EQ(from_document<std::vector<int>>(n), v);
}

TEST(Conversion, Optional) {
    std::optional<int> none;
    std::optional<int> some = 5;
    EXPECT_TRUE(to_document(none).is_null());
    EXPECT_EQ(to_document(some), Node(5));
    EXPECT_FALSE(from_document<std::optional<int>>(Node()).has_value());
    EXPECT_EQ(from_document<std::optional<int>>(Node(5)), 5);
}

TEST(Conversion, NodePassesThrough) {
    Node n(Object{{"a", 1}});
    EXPECT_EQ(to_document(n), n);
    EXPECT_EQ(from_document<Node>(n), n);
}

// ═══════════════════════════════════════════════════════════════════════════════
// User types
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Conversion, UserTypeThroughAdl) {
    game::Stats s{10, 3};
    Node n = to_document(s);
    EXPECT_EQ(write(n), R"({"hp":10,"mp":3})");
    EXPECT_EQ(from_document<game::Stats>(n), s);
}

TEST(Conversion, UserTypeInsideContainers) {
    std::vector<game::Stats> party{{10, 3}, {7, 9}};
    const std::string text = save_string(party);
    EXPECT_EQ(text, R"([{"hp":10,"mp":3},{"hp":7,"mp":9}])");
    EXPECT_EQ(load_string<std::vector<game::Stats>>(text), party);
}

TEST(Conversion, UserTypeAsDictionaryValue) {
    SerializableDictionary<std::string, game::Stats> party;
    party.add("knight", {12, 0});
    party.add("mage", {6, 20});

    auto loaded = load_string<SerializableDictionary<std::string, game::Stats>>(save_string(party));
    EXPECT_EQ(loaded, party);
    EXPECT_EQ(loaded.get("mage").mp, 20);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Text helpers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Conversion, SaveStringPretty) {
    WriteOptions opts;
    opts.indent = 2;
    EXPECT_EQ(save_string(std::vector<int>{1}, opts), "[\n  1\n]");
}

TEST(Conversion, LoadStringParseError) {
    EXPECT_THROW((void)load_string<std::vector<int>>("[1,"), ParseError);
}

TEST(Conversion, TryLoadString) {
    auto ok = try_load_string<std::vector<int>>("[1,2]");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value.size(), 2u);

    auto parse_fail = try_load_string<std::vector<int>>("[1,");
    EXPECT_EQ(parse_fail.ec, errc::unexpected_end_of_input);

    auto type_fail = try_load_string<std::vector<int>>(R"(["x"])");
    EXPECT_EQ(type_fail.ec, errc::type_mismatch);
    EXPECT_TRUE(type_fail.value.empty());
}
