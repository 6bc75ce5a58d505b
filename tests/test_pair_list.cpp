/// @file test_pair_list.cpp
/// @brief Unit tests for SerializablePair and PairList — list API, record capabilities, load.

#include <seqdict/seqdict.hpp>

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <vector>

using namespace seqdict;

using IntPair = SerializablePair<int, int>;
using IntList = PairList<int, int>;

static_assert(is_record_sequence_v<IntList, int, int>);
static_assert(is_record_sequence_v<PairList<std::string, std::vector<int>>,
                                   std::string, std::vector<int>>);
static_assert(!is_record_sequence_v<std::vector<IntPair>, int, int>);

// ═══════════════════════════════════════════════════════════════════════════════
// SerializablePair
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SerializablePair, AccessorsAndMutators) {
    IntPair p(1, 10);
    EXPECT_EQ(p.key(), 1);
    EXPECT_EQ(p.value(), 10);
    p.set_key(2);
    p.set_value(20);
    EXPECT_EQ(p, IntPair(2, 20));
    EXPECT_NE(p, IntPair(2, 21));
}

TEST(SerializablePair, PersistedForm) {
    SerializablePair<std::string, int> p("hp", 5);
    EXPECT_EQ(save_string(p), R"({"key":"hp","value":5})");
    EXPECT_EQ((load_string<SerializablePair<std::string, int>>(R"({"value":5,"key":"hp"})")), p);
}

TEST(SerializablePair, MissingMemberThrows) {
    EXPECT_THROW((void)load_string<IntPair>(R"({"key":1})"), KeyNotFoundError);
    EXPECT_THROW((void)load_string<IntPair>("[1,2]"), TypeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// List API
// ═══════════════════════════════════════════════════════════════════════════════

TEST(PairList, AddAndIndex) {
    IntList list;
    EXPECT_TRUE(list.empty());
    list.add(1, 10);
    list.push_back(IntPair(2, 20));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], IntPair(1, 10));
    EXPECT_EQ(list.at(1).value(), 20);
    EXPECT_THROW((void)list.at(2), OutOfRangeError);
}

TEST(PairList, InsertAndEraseAt) {
    IntList list{{1, 10}, {3, 30}};
    list.insert(1, IntPair(2, 20));
    list.insert(3, IntPair(4, 40));
    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list[1].key(), 2);
    EXPECT_EQ(list[3].key(), 4);
    EXPECT_THROW(list.insert(9, IntPair(9, 9)), OutOfRangeError);

    list.erase_at(0);
    EXPECT_EQ(list[0].key(), 2);
    EXPECT_THROW(list.erase_at(3), OutOfRangeError);
}

TEST(PairList, RemoveIndexOfContains) {
    IntList list{{1, 10}, {2, 20}, {1, 10}};
    EXPECT_EQ(list.index_of(IntPair(2, 20)), 1u);
    EXPECT_EQ(list.index_of(IntPair(2, 21)), IntList::npos);
    EXPECT_TRUE(list.contains(IntPair(1, 10)));

    EXPECT_TRUE(list.remove(IntPair(1, 10)));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].key(), 2);
    EXPECT_EQ(list[1].key(), 1);
    EXPECT_FALSE(list.remove(IntPair(7, 70)));
}

TEST(PairList, CopyTo) {
    IntList list{{1, 10}, {2, 20}};
    std::vector<IntPair> dest(4);
    list.copy_to(dest, 1);
    EXPECT_EQ(dest[0], IntPair());
    EXPECT_EQ(dest[1], IntPair(1, 10));
    EXPECT_EQ(dest[2], IntPair(2, 20));

    std::array<IntPair, 2> exact{};
    list.copy_to(exact);
    EXPECT_EQ(exact[1], IntPair(2, 20));
}

TEST(PairList, CopyToWithoutRoomThrows) {
    IntList list{{1, 10}, {2, 20}};
    std::vector<IntPair> small(2);
    EXPECT_THROW(list.copy_to(small, 1), OutOfRangeError);
    EXPECT_THROW(list.copy_to(small, 5), OutOfRangeError);
    std::vector<IntPair> none;
    EXPECT_THROW(list.copy_to(none), OutOfRangeError);
}

TEST(PairList, Clear) {
    IntList list{{1, 10}};
    list.clear();
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.begin(), list.end());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Record-sequence capabilities
// ═══════════════════════════════════════════════════════════════════════════════

TEST(PairListRecords, UpsertKeepsPosition) {
    IntList list{{1, 10}, {2, 20}};
    EXPECT_EQ(list.upsert(1, 11), 0u);
    EXPECT_EQ(list.upsert(3, 30), 2u);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list.key_at(0), 1);
    EXPECT_EQ(list.value_at(0), 11);
    EXPECT_EQ(list.key_at(2), 3);
}

TEST(PairListRecords, RemoveKeyRemovesFirstMatchOnly) {
    IntList list{{1, 10}, {2, 20}, {1, 30}};
    EXPECT_TRUE(list.remove_key(1));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], IntPair(2, 20));
    EXPECT_EQ(list[1], IntPair(1, 30));
    EXPECT_FALSE(list.remove_key(5));
}

TEST(PairListRecords, UpsertAndRemoveKeyUseGivenEquality) {
    // Keys equal when they agree modulo 10.
    auto same_decade = [](int a, int b) { return a % 10 == b % 10; };
    IntList list{{1, 10}, {2, 20}};
    EXPECT_EQ(list.upsert(11, 99, same_decade), 0u);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], IntPair(1, 99));

    EXPECT_TRUE(list.remove_key(12, same_decade));
    ASSERT_EQ(list.size(), 1u);
    EXPECT_FALSE(list.remove_key(12));
}

TEST(PairListRecords, CollapseDuplicates) {
    IntList list{{1, 10}, {2, 20}, {1, 30}, {3, 40}, {2, 50}};
    EXPECT_EQ(list.collapse_duplicates(std::hash<int>{}, std::equal_to<int>{}), 2u);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], IntPair(1, 30));
    EXPECT_EQ(list[1], IntPair(2, 50));
    EXPECT_EQ(list[2], IntPair(3, 40));

    EXPECT_EQ(list.collapse_duplicates(std::hash<int>{}, std::equal_to<int>{}), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persisted form
// ═══════════════════════════════════════════════════════════════════════════════

TEST(PairListPersist, RoundTripKeepsOrder) {
    IntList list{{3, 30}, {1, 10}, {2, 20}};
    const std::string text = save_string(list);
    EXPECT_EQ(text, R"([{"key":3,"value":30},{"key":1,"value":10},{"key":2,"value":20}])");
    EXPECT_EQ(load_string<IntList>(text), list);
}

TEST(PairListPersist, NullDocumentLoadsEmpty) {
    EXPECT_TRUE(load_string<IntList>("null").empty());
}

TEST(PairListPersist, LenientLoadSkipsMalformedRecords) {
    const char* text = R"([
        {"key":1,"value":10},
        null,
        5,
        {"key":2},
        {"value":3},
        {"key":"x","value":4},
        {"key":6,"value":60}
    ])";
    IntList list = load_string<IntList>(text);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], IntPair(1, 10));
    EXPECT_EQ(list[1], IntPair(6, 60));
}

TEST(PairListPersist, StrictLoadRejectsMalformedRecords) {
    try {
        (void)load_string<IntList>(R"([{"key":1,"value":10},null])", {}, LoadOptions::strict());
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.code(), errc::malformed_record);
        EXPECT_NE(std::string(e.what()).find("index 1"), std::string::npos);
    }
}

TEST(PairListPersist, NonArrayDocumentIsTypeError) {
    EXPECT_THROW((void)load_string<IntList>(R"({"key":1,"value":2})"), TypeError);
}
