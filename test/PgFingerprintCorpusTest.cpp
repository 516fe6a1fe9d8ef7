#include "gtest/gtest.h"
#include "core/PgFingerprintCorpus.hpp"
#include "core/NearestMatchSearch.hpp"
#include "core/DuplicateClassifier.hpp"
#include "utils/Config.hpp"
#include "TestImages.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <set>
#include <thread>

using namespace DupFinder;

// --- IMPORTANT ---
// These tests require a LIVE PostgreSQL server running.
// They will connect to a database named "dupfinder_test_db" unless
// DUPFINDER_DATABASE_URL or DB_NAME says otherwise.
// YOU MUST CREATE THIS DATABASE MANUALLY:
// > psql -U postgres
// > CREATE DATABASE dupfinder_test_db;
//
// The tests will perma-delete all data in this DB on setup/teardown.
// DO NOT point this at a production database.

namespace {

std::string testConnectionString() {
    Settings settings;
    settings.applyEnvironment();
    if (settings.database.url.empty() && !std::getenv("DB_NAME")) {
        return "dbname=dupfinder_test_db host=localhost";
    }
    return settings.connectionString();
}

CorpusEntry entry(ConversationId conv, MessageId msg, Fingerprint fp, const std::string& label = "chat") {
    CorpusEntry e;
    e.conversationId = conv;
    e.messageId = msg;
    e.fingerprint = fp;
    e.label = label;
    return e;
}

} // namespace

class PgFingerprintCorpusTest : public ::testing::Test {
protected:
    std::unique_ptr<PgFingerprintCorpus> db;

    void SetUp() override {
        try {
            db = std::make_unique<PgFingerprintCorpus>(testConnectionString(), 2);
            db->resetDatabase(); // Clean the DB before each test
        } catch (const std::exception& e) {
            std::cerr << "DB CONNECTION FAILED: " << e.what() << std::endl;
            std::cerr << "Skipping database tests. Ensure PostgreSQL is running and "
                      << "'dupfinder_test_db' exists." << std::endl;
            db.reset();
        }
    }

    void TearDown() override {
        if (db) {
            db->resetDatabase();
        }
    }
};

TEST_F(PgFingerprintCorpusTest, InsertAndFind) {
    if (!db) { GTEST_SKIP() << "Skipping test, no DB connection"; }

    ASSERT_TRUE(db->insert(entry(-1001234567890, 10, 0xDEADBEEFULL, "Cat Pictures")));

    auto found = db->find(-1001234567890, 10);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->fingerprint, 0xDEADBEEFULL);
    EXPECT_EQ(found->label, "Cat Pictures");
    EXPECT_GT(found->sequence, 0);

    EXPECT_FALSE(db->find(-1001234567890, 11).has_value());
    EXPECT_EQ(db->count(-1001234567890), 1u);
}

TEST_F(PgFingerprintCorpusTest, ConflictingInsertIsIgnored) {
    if (!db) { GTEST_SKIP() << "Skipping test, no DB connection"; }

    ASSERT_TRUE(db->insert(entry(1, 10, 0x1ULL, "first")));
    EXPECT_FALSE(db->insert(entry(1, 10, 0x2ULL, "second")));

    EXPECT_EQ(db->count(1), 1u);
    EXPECT_EQ(db->find(1, 10)->fingerprint, 0x1ULL);
    EXPECT_EQ(db->find(1, 10)->label, "first");
}

TEST_F(PgFingerprintCorpusTest, HighBitFingerprintRoundTrips) {
    if (!db) { GTEST_SKIP() << "Skipping test, no DB connection"; }

    const Fingerprint fp = 0xFFFFFFFFFFFFFFFFULL;
    const Fingerprint top = 0x8000000000000001ULL;
    db->insert(entry(1, 1, fp));
    db->insert(entry(1, 2, top));

    EXPECT_EQ(db->find(1, 1)->fingerprint, fp);
    EXPECT_EQ(db->find(1, 2)->fingerprint, top);
}

TEST_F(PgFingerprintCorpusTest, ScanVisitsOnlyTheConversation) {
    if (!db) { GTEST_SKIP() << "Skipping test, no DB connection"; }

    db->insert(entry(1, 10, 0x1ULL));
    db->insert(entry(2, 11, 0x2ULL));
    db->insert(entry(1, 12, 0x3ULL));

    std::set<MessageId> seen;
    db->scan(1, [&](const CorpusEntry& e) {
        EXPECT_EQ(e.conversationId, 1);
        seen.insert(e.messageId);
    });
    EXPECT_EQ(seen, (std::set<MessageId>{10, 12}));

    EXPECT_LT(db->find(1, 10)->sequence, db->find(1, 12)->sequence);
}

TEST_F(PgFingerprintCorpusTest, EntriesSurviveReconnect) {
    if (!db) { GTEST_SKIP() << "Skipping test, no DB connection"; }

    db->insert(entry(5, 50, 0xABCDULL, "persisted"));

    PgFingerprintCorpus reopened(testConnectionString(), 1);
    auto found = reopened.find(5, 50);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->fingerprint, 0xABCDULL);
    EXPECT_EQ(found->label, "persisted");
}

TEST_F(PgFingerprintCorpusTest, ConcurrentInsertsShareThePool) {
    if (!db) { GTEST_SKIP() << "Skipping test, no DB connection"; }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                db->insert(entry(1, t * 100 + i, static_cast<Fingerprint>(i)));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(db->count(1), 100u);
}

TEST_F(PgFingerprintCorpusTest, SearchAndClassifyAgainstDatabase) {
    if (!db) { GTEST_SKIP() << "Skipping test, no DB connection"; }

    DuplicateClassifier classifier(*db);
    auto image = TestImages::sceneBytes(9);

    EXPECT_EQ(classifier.classifyNewImage(-1002, 1, "chat", image).verdict, Classification::Verdict::NewImage);
    auto repost = classifier.classifyNewImage(-1002, 2, "chat", image);
    ASSERT_EQ(repost.verdict, Classification::Verdict::Duplicate);
    EXPECT_EQ(repost.match->messageId, 1);
    EXPECT_EQ(repost.match->distance, 0u);

    db->insert(entry(-1002, 3, 0x0ULL));
    db->insert(entry(-1002, 4, 0x0ULL));
    auto tie = NearestMatchSearch::findClosest(*db, -1002, 0x1ULL, MessageId{1});
    ASSERT_TRUE(tie.has_value());
    EXPECT_EQ(tie->messageId, 3);
}

TEST_F(PgFingerprintCorpusTest, DroppedConnectionIsReplacedOnNextCheckout) {
    if (!db) { GTEST_SKIP() << "Skipping test, no DB connection"; }

    // Tag the single pooled connection so only it gets terminated
    const std::string appName = "dupfinder_pool_test";
    setenv("PGAPPNAME", appName.c_str(), 1);
    PgFingerprintCorpus pooled(testConnectionString(), 1);
    unsetenv("PGAPPNAME");

    ASSERT_TRUE(pooled.insert(entry(9, 90, 0x90ULL, "pool")));

    pqxx::connection admin(testConnectionString());
    {
        pqxx::nontransaction txn(admin);
        txn.exec_params("SELECT pg_terminate_backend(pid) FROM pg_stat_activity "
                        "WHERE datname = current_database() AND pid <> pg_backend_pid() "
                        "AND application_name = $1", appName);
    }
    // Wait for the backend to exit
    for (int i = 0; i < 100; ++i) {
        pqxx::nontransaction txn(admin);
        auto res = txn.exec_params("SELECT COUNT(*) FROM pg_stat_activity WHERE application_name = $1", appName);
        if (res[0][0].as<int>() == 0) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    // The idle connection still looks open, so the first use fails...
    EXPECT_THROW(pooled.count(9), CorpusError);
    // ...and the next checkout opens a fresh one
    EXPECT_EQ(pooled.count(9), 1u);
    auto found = pooled.find(9, 90);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->fingerprint, 0x90ULL);
}

TEST(PgFingerprintCorpusConnectTest, UnreachableDatabaseIsCorpusError) {
    EXPECT_THROW(PgFingerprintCorpus("host=127.0.0.1 port=1 dbname=nothing connect_timeout=1"), CorpusError);
}
