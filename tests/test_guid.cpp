/// @file test_guid.cpp
/// @brief Unit tests for Guid and GuidRegistry — generation, release, loading.

#include <seqdict/seqdict.hpp>

#include <gtest/gtest.h>

#include <thread>
#include <unordered_set>
#include <vector>

using namespace seqdict;

// ═══════════════════════════════════════════════════════════════════════════════
// Guid value
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Guid, DefaultIsInvalid) {
    Guid g;
    EXPECT_FALSE(g.is_valid());
    EXPECT_EQ(g, Guid::invalid());
    EXPECT_EQ(g.id(), 0);
}

TEST(Guid, EqualityAndHash) {
    EXPECT_EQ(Guid(5), Guid(5));
    EXPECT_NE(Guid(5), Guid(6));

    std::unordered_set<Guid> set{Guid(1), Guid(2), Guid(1)};
    EXPECT_EQ(set.size(), 2u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Registry
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GuidRegistry, GenerateMarksUsed) {
    GuidRegistry reg(42);
    Guid g = reg.generate();
    EXPECT_TRUE(g.is_valid());
    EXPECT_GT(g.id(), 0);
    EXPECT_TRUE(reg.is_used(g));
    EXPECT_EQ(reg.size(), 1u);
}

TEST(GuidRegistry, GeneratedIdsAreUnique) {
    GuidRegistry reg(7);
    std::unordered_set<Guid> seen;
    for (int i = 0; i < 1000; ++i) seen.insert(reg.generate());
    EXPECT_EQ(seen.size(), 1000u);
    EXPECT_EQ(reg.size(), 1000u);
}

TEST(GuidRegistry, SameSeedSameSequence) {
    GuidRegistry a(99);
    GuidRegistry b(99);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(a.generate(), b.generate());
}

TEST(GuidRegistry, ReleaseFreesId) {
    GuidRegistry reg(1);
    Guid g = reg.generate();
    EXPECT_TRUE(reg.release(g));
    EXPECT_FALSE(reg.is_used(g));
    EXPECT_FALSE(reg.release(g));
    EXPECT_EQ(reg.size(), 0u);
}

TEST(GuidRegistry, ExhaustedIdSpaceThrows) {
    GuidRegistry reg(3, 1);
    EXPECT_EQ(reg.generate(), Guid(1));
    try {
        (void)reg.generate();
        FAIL() << "expected IdExhaustedError";
    } catch (const IdExhaustedError& e) {
        EXPECT_EQ(e.code(), errc::id_space_exhausted);
    }
    EXPECT_EQ(reg.size(), 1u);
}

TEST(GuidRegistry, RegisterLoadedIgnoresInvalid) {
    GuidRegistry reg(5);
    reg.register_loaded(Guid());
    EXPECT_EQ(reg.size(), 0u);
    reg.register_loaded(Guid(77));
    EXPECT_TRUE(reg.is_used(77));
}

TEST(GuidRegistry, LoadedIdIsNeverGeneratedAgain) {
    GuidRegistry reg(11, 2);
    reg.register_loaded(Guid(1));
    EXPECT_EQ(reg.generate(), Guid(2));
    EXPECT_THROW((void)reg.generate(), IdExhaustedError);
}

TEST(GuidRegistry, ConcurrentGenerate) {
    GuidRegistry reg(21);
    std::vector<std::vector<Guid>> per_thread(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < per_thread.size(); ++t) {
        threads.emplace_back([&reg, &out = per_thread[t]] {
            for (int i = 0; i < 250; ++i) out.push_back(reg.generate());
        });
    }
    for (auto& th : threads) th.join();

    std::unordered_set<Guid> all;
    for (const auto& v : per_thread) all.insert(v.begin(), v.end());
    EXPECT_EQ(all.size(), 1000u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GuidPersist, SavedAsInteger) {
    EXPECT_EQ(save_string(Guid(1234)), "1234");
    EXPECT_EQ(save_string(Guid()), "0");
}

TEST(GuidPersist, LoadRegistersWithGlobalRegistry) {
    constexpr int32_t id = 1357911;
    GuidRegistry::global().release(Guid(id));

    Guid g = load_string<Guid>("1357911");
    EXPECT_EQ(g.id(), id);
    EXPECT_TRUE(GuidRegistry::global().is_used(id));

    GuidRegistry::global().release(g);
}

TEST(GuidPersist, OutOfRangeIdRejected) {
    EXPECT_THROW((void)load_string<Guid>("4294967296"), TypeError);
    EXPECT_THROW((void)load_string<Guid>("\"7\""), TypeError);
}

TEST(GuidPersist, GuidKeyedDictionary) {
    GuidRegistry reg(8);
    SerializableDictionary<Guid, std::string> names;
    const Guid a = reg.generate();
    const Guid b = reg.generate();
    names.add(a, "alpha");
    names.add(b, "beta");

    auto loaded = load_string<SerializableDictionary<Guid, std::string>>(save_string(names));
    EXPECT_EQ(loaded.get(b), "beta");
    EXPECT_TRUE(GuidRegistry::global().is_used(a));

    GuidRegistry::global().release(a);
    GuidRegistry::global().release(b);
}
