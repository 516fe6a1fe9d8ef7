#pragma once

#include <optional>
#include <vector>

#include "FingerprintCorpus.hpp"

namespace DupFinder
{

/**
 * @brief Closest-fingerprint lookup within one conversation.
 *
 * Linear scan over the conversation's entries. The smallest Hamming distance
 * wins; on equal distance the earliest inserted entry (lowest sequence) wins,
 * so repeated reposts always point back at the original.
 */
class NearestMatchSearch {
public:
    /**
     * @param exclude Message id to ignore, e.g. the message the query came from.
     * @param maxDistance If set, no match is reported unless the minimum distance is <= it.
     * @return std::nullopt if the scope is empty after exclusion or nothing is close enough.
     * @throws CorpusError if the corpus cannot be scanned.
     */
    static std::optional<Match> findClosest(const FingerprintCorpus& corpus,
                                            ConversationId conversationId,
                                            Fingerprint query,
                                            std::optional<MessageId> exclude = std::nullopt,
                                            std::optional<unsigned> maxDistance = std::nullopt);

    /**
     * @brief Same selection rule over entries the caller already holds.
     *
     * Entries of other conversations are ignored.
     */
    static std::optional<Match> findClosest(const std::vector<CorpusEntry>& entries,
                                            ConversationId conversationId,
                                            Fingerprint query,
                                            std::optional<MessageId> exclude = std::nullopt,
                                            std::optional<unsigned> maxDistance = std::nullopt);

private:
    /// Running minimum over a stream of entries.
    class Selector {
    public:
        Selector(Fingerprint query, std::optional<MessageId> exclude)
            : m_query(query), m_exclude(exclude) {}

        void offer(const CorpusEntry& entry);
        std::optional<Match> result(std::optional<unsigned> maxDistance) const;

    private:
        Fingerprint m_query;
        std::optional<MessageId> m_exclude;
        bool m_found = false;
        Match m_best;
        std::int64_t m_bestSequence = 0;
    };
};

} // namespace DupFinder
