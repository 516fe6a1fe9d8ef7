#pragma once

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <vector>

#include "FingerprintCorpus.hpp"

namespace DupFinder
{

/**
 * @brief Non-durable corpus kept in process memory.
 *
 * Backs `import --dry_run` and the tests. Readers share the lock; inserts are exclusive.
 */
class MemoryCorpus : public FingerprintCorpus {
public:
    bool insert(const CorpusEntry& entry) override;
    void scan(ConversationId conversationId, const Visitor& visitor) const override;
    std::optional<CorpusEntry> find(ConversationId conversationId, MessageId messageId) const override;
    std::size_t count(ConversationId conversationId) const override;

private:
    // Snapshot of a conversation, so visitors run without holding the lock
    std::vector<CorpusEntry> snapshot(ConversationId conversationId) const;

    mutable std::shared_mutex m_mutex;
    std::map<ConversationId, std::vector<CorpusEntry>> m_entries;
    std::int64_t m_nextSequence = 1;
};

} // namespace DupFinder
