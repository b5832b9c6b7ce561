#include <gtest/gtest.h>
#include "database/DBPool.hpp"
#include "database/PgLinkStore.hpp"
#include "database/init_db_tables.hpp"
#include "link/Errors.hpp"
#include "types/ListQueryParams.hpp"

#include <pqxx/pqxx>
#include <random>

using namespace ql::database;
using ql::link::ErrorCode;
using ql::link::LinkError;

// Runs against a disposable database named by QL_TEST_DATABASE_URL; skipped otherwise.
class PgLinkStoreTest : public ::testing::Test {
protected:
    std::string connStr;
    std::string prefix;
    std::shared_ptr<PgLinkStore> store;

    void SetUp() override {
        const char* url = std::getenv("QL_TEST_DATABASE_URL");
        if (!url || !*url) GTEST_SKIP() << "QL_TEST_DATABASE_URL not set";
        connStr = url;

        seed::init_tables_if_not_exists(connStr);
        store = std::make_shared<PgLinkStore>(std::make_shared<DBPool>(connStr, 2));

        std::mt19937_64 rng(std::random_device{}());
        prefix = "t" + std::to_string(rng() % 1000000000) + "x";
    }

    void TearDown() override {
        if (connStr.empty()) return;
        pqxx::connection conn(connStr);
        pqxx::work txn(conn);
        txn.exec("DELETE FROM links WHERE short_code LIKE $1", pqxx::params{prefix + "%"});
        txn.commit();
    }

    std::string code(const std::string& suffix) const { return prefix + suffix; }
};

TEST_F(PgLinkStoreTest, CreateAndFind) {
    const auto created = store->create(code("a"), "https://example.com/a");
    ASSERT_NE(created, nullptr);
    EXPECT_GT(created->id, 0u);
    EXPECT_FALSE(created->qr_code_url.has_value());

    const auto found = store->findByCode(code("a"));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->original_url, "https://example.com/a");
    EXPECT_TRUE(store->exists(code("a")));
    EXPECT_EQ(store->findByCode(code("missing")), nullptr);
    EXPECT_FALSE(store->exists(code("missing")));
}

TEST_F(PgLinkStoreTest, DuplicateCodeConflicts) {
    (void)store->create(code("dup"), "https://example.com/1");
    try {
        (void)store->create(code("dup"), "https://example.com/2");
        FAIL() << "expected Conflict";
    } catch (const LinkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Conflict);
    }
    EXPECT_EQ(store->findByCode(code("dup"))->original_url, "https://example.com/1");
}

TEST_F(PgLinkStoreTest, AttachQrUrl) {
    (void)store->create(code("qr"), "https://example.com");
    store->attachQrUrl(code("qr"), "https://cdn.test/qr.png");
    EXPECT_EQ(store->findByCode(code("qr"))->qr_code_url, "https://cdn.test/qr.png");

    try {
        store->attachQrUrl(code("none"), "https://cdn.test/none.png");
        FAIL() << "expected NotFound";
    } catch (const LinkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(PgLinkStoreTest, ListIsNewestFirst) {
    (void)store->create(code("l1"), "https://example.com/1");
    (void)store->create(code("l2"), "https://example.com/2");

    ql::types::ListQueryParams params;
    params.limit = 2;
    const auto links = store->list(params);
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0]->short_code, code("l2"));
    EXPECT_EQ(links[1]->short_code, code("l1"));
}
