#pragma once

#include <cstddef>
#include <functional>
#include <optional>

#include "Common.hpp"

namespace DupFinder
{

/**
 * @brief Append-only store of fingerprints, scoped by conversation.
 *
 * Implementations are shared by concurrent workers and must be safe to call
 * from several threads at once. Entries are never updated or removed.
 */
class FingerprintCorpus {
public:
    using Visitor = std::function<void(const CorpusEntry&)>;

    virtual ~FingerprintCorpus() = default;

    /**
     * @brief Records an entry. `entry.sequence` is ignored and assigned by the corpus.
     * @return false if (conversationId, messageId) is already recorded; the
     *         existing entry is left untouched.
     * @throws CorpusError on storage failure.
     */
    virtual bool insert(const CorpusEntry& entry) = 0;

    /**
     * @brief Visits every entry committed to the conversation before the call.
     *
     * Entries are delivered one at a time in no particular order.
     * @throws CorpusError on storage failure.
     */
    virtual void scan(ConversationId conversationId, const Visitor& visitor) const = 0;

    virtual std::optional<CorpusEntry> find(ConversationId conversationId, MessageId messageId) const = 0;

    virtual std::size_t count(ConversationId conversationId) const = 0;
};

} // namespace DupFinder
