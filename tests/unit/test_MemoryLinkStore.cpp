#include <gtest/gtest.h>
#include "link/Errors.hpp"
#include "link/MemoryLinkStore.hpp"

#include <atomic>
#include <set>
#include <thread>

using namespace ql::link;
using namespace ql::types;

class MemoryLinkStoreTest : public ::testing::Test {
protected:
    MemoryLinkStore store;
};

TEST_F(MemoryLinkStoreTest, CreateThenFind) {
    const auto created = store.create("abc123", "https://example.com/a/b");
    ASSERT_NE(created, nullptr);
    EXPECT_GT(created->id, 0u);
    EXPECT_FALSE(created->qr_code_url.has_value());

    const auto found = store.findByCode("abc123");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->original_url, "https://example.com/a/b");
    EXPECT_EQ(found->id, created->id);
    EXPECT_TRUE(store.exists("abc123"));
}

TEST_F(MemoryLinkStoreTest, UnknownCodeIsNull) {
    EXPECT_EQ(store.findByCode("nope"), nullptr);
    EXPECT_FALSE(store.exists("nope"));
}

TEST_F(MemoryLinkStoreTest, DuplicateCreateConflicts) {
    (void)store.create("dup", "https://example.com/1");
    try {
        (void)store.create("dup", "https://example.com/2");
        FAIL() << "expected Conflict";
    } catch (const LinkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Conflict);
    }
    EXPECT_EQ(store.findByCode("dup")->original_url, "https://example.com/1");
}

TEST_F(MemoryLinkStoreTest, CodesAreCaseSensitive) {
    (void)store.create("Case", "https://example.com/upper");
    (void)store.create("case", "https://example.com/lower");
    EXPECT_EQ(store.findByCode("Case")->original_url, "https://example.com/upper");
    EXPECT_EQ(store.findByCode("case")->original_url, "https://example.com/lower");
}

TEST_F(MemoryLinkStoreTest, AttachQrUrlOverwrites) {
    (void)store.create("qr", "https://example.com");
    store.attachQrUrl("qr", "https://cdn/qr/1.png");
    EXPECT_EQ(store.findByCode("qr")->qr_code_url, "https://cdn/qr/1.png");
    store.attachQrUrl("qr", "https://cdn/qr/2.png");
    EXPECT_EQ(store.findByCode("qr")->qr_code_url, "https://cdn/qr/2.png");
}

TEST_F(MemoryLinkStoreTest, AttachQrUrlToUnknownCodeIsNotFound) {
    try {
        store.attachQrUrl("ghost", "https://cdn/qr/ghost.png");
        FAIL() << "expected NotFound";
    } catch (const LinkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(MemoryLinkStoreTest, ReturnedLinksAreSnapshots) {
    (void)store.create("snap", "https://example.com");
    const auto before = store.findByCode("snap");
    store.attachQrUrl("snap", "https://cdn/qr/snap.png");
    EXPECT_FALSE(before->qr_code_url.has_value());
}

TEST_F(MemoryLinkStoreTest, ListIsNewestFirstAndPaged) {
    for (int i = 0; i < 10; ++i) (void)store.create("code" + std::to_string(i), "https://example.com/" + std::to_string(i));

    ListQueryParams all;
    const auto links = store.list(all);
    ASSERT_EQ(links.size(), 10u);
    EXPECT_EQ(links.front()->short_code, "code9");
    EXPECT_EQ(links.back()->short_code, "code0");

    ListQueryParams page;
    page.limit = 3;
    page.offset = 2;
    const auto paged = store.list(page);
    ASSERT_EQ(paged.size(), 3u);
    EXPECT_EQ(paged[0]->short_code, "code7");
    EXPECT_EQ(paged[2]->short_code, "code5");

    ListQueryParams past;
    past.offset = 50;
    EXPECT_TRUE(store.list(past).empty());
}

TEST_F(MemoryLinkStoreTest, ConcurrentCreatesOfSameCodeHaveOneWinner) {
    constexpr int kThreads = 16;
    std::atomic<int> wins{0}, conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            try {
                (void)store.create("race", "https://example.com/" + std::to_string(i));
                ++wins;
            } catch (const LinkError& e) {
                if (e.code() == ErrorCode::Conflict) ++conflicts;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(conflicts.load(), kThreads - 1);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(MemoryLinkStoreTest, ConcurrentDistinctCreatesAllSucceed) {
    constexpr int kThreads = 8, kPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i)
                (void)store.create("t" + std::to_string(t) + "n" + std::to_string(i), "https://example.com");
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(store.size(), static_cast<size_t>(kThreads * kPerThread));

    std::set<uint64_t> ids;
    ListQueryParams p;
    p.limit = ListQueryParams::MAX_LIMIT;
    for (int64_t off = 0; off < kThreads * kPerThread; off += ListQueryParams::MAX_LIMIT) {
        p.offset = off;
        for (const auto& l : store.list(p)) ids.insert(l->id);
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(kThreads * kPerThread));
}
