#include "gtest/gtest.h"
#include "core/MemoryCorpus.hpp"

#include <set>
#include <thread>

using namespace DupFinder;

namespace {

CorpusEntry entry(ConversationId conv, MessageId msg, Fingerprint fp, const std::string& label = "chat") {
    CorpusEntry e;
    e.conversationId = conv;
    e.messageId = msg;
    e.fingerprint = fp;
    e.label = label;
    return e;
}

} // namespace

TEST(MemoryCorpusTest, InsertAndFind) {
    MemoryCorpus corpus;
    ASSERT_TRUE(corpus.insert(entry(1, 10, 0xDEADBEEFULL, "cats")));

    auto found = corpus.find(1, 10);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->fingerprint, 0xDEADBEEFULL);
    EXPECT_EQ(found->label, "cats");
    EXPECT_GT(found->sequence, 0);

    EXPECT_FALSE(corpus.find(1, 11).has_value());
    EXPECT_FALSE(corpus.find(2, 10).has_value());
}

TEST(MemoryCorpusTest, DuplicateKeyIsIgnored) {
    MemoryCorpus corpus;
    ASSERT_TRUE(corpus.insert(entry(1, 10, 0x1ULL, "first")));
    EXPECT_FALSE(corpus.insert(entry(1, 10, 0x2ULL, "second")));

    EXPECT_EQ(corpus.count(1), 1u);
    EXPECT_EQ(corpus.find(1, 10)->fingerprint, 0x1ULL);
    EXPECT_EQ(corpus.find(1, 10)->label, "first");

    // Same message id in another conversation is a different key
    EXPECT_TRUE(corpus.insert(entry(2, 10, 0x2ULL)));
}

TEST(MemoryCorpusTest, ScanVisitsOnlyTheConversation) {
    MemoryCorpus corpus;
    corpus.insert(entry(1, 10, 0x1ULL));
    corpus.insert(entry(2, 11, 0x2ULL));
    corpus.insert(entry(1, 12, 0x3ULL));

    std::set<MessageId> seen;
    std::int64_t lastSequence = 0;
    corpus.scan(1, [&](const CorpusEntry& e) {
        EXPECT_EQ(e.conversationId, 1);
        EXPECT_GT(e.sequence, lastSequence);
        lastSequence = e.sequence;
        seen.insert(e.messageId);
    });

    EXPECT_EQ(seen, (std::set<MessageId>{10, 12}));
    EXPECT_EQ(corpus.count(3), 0u);
}

TEST(MemoryCorpusTest, SequenceIgnoresCallerValue) {
    MemoryCorpus corpus;
    CorpusEntry e = entry(1, 10, 0x1ULL);
    e.sequence = 999;
    corpus.insert(e);
    corpus.insert(entry(1, 11, 0x1ULL));

    EXPECT_LT(corpus.find(1, 10)->sequence, corpus.find(1, 11)->sequence);
    EXPECT_NE(corpus.find(1, 10)->sequence, 999);
}

TEST(MemoryCorpusTest, ConcurrentInsertsAreAllKept) {
    MemoryCorpus corpus;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 250; ++i) {
                corpus.insert(entry(1, t * 1000 + i, static_cast<Fingerprint>(i)));
                corpus.scan(1, [](const CorpusEntry&) {});
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(corpus.count(1), 1000u);
}
