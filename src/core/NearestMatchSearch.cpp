#include "NearestMatchSearch.hpp"

namespace DupFinder
{

void NearestMatchSearch::Selector::offer(const CorpusEntry& entry) {
    if (m_exclude && entry.messageId == *m_exclude) return;

    const unsigned distance = hammingDistance(m_query, entry.fingerprint);
    const bool better = !m_found
        || distance < m_best.distance
        || (distance == m_best.distance && entry.sequence < m_bestSequence);

    if (better) {
        m_found = true;
        m_best = Match{entry.messageId, distance};
        m_bestSequence = entry.sequence;
    }
}

std::optional<Match> NearestMatchSearch::Selector::result(std::optional<unsigned> maxDistance) const {
    if (!m_found) return std::nullopt;
    if (maxDistance && m_best.distance > *maxDistance) return std::nullopt;
    return m_best;
}

std::optional<Match> NearestMatchSearch::findClosest(const FingerprintCorpus& corpus,
                                                     ConversationId conversationId,
                                                     Fingerprint query,
                                                     std::optional<MessageId> exclude,
                                                     std::optional<unsigned> maxDistance) {
    Selector selector(query, exclude);
    corpus.scan(conversationId, [&selector](const CorpusEntry& entry) { selector.offer(entry); });
    return selector.result(maxDistance);
}

std::optional<Match> NearestMatchSearch::findClosest(const std::vector<CorpusEntry>& entries,
                                                     ConversationId conversationId,
                                                     Fingerprint query,
                                                     std::optional<MessageId> exclude,
                                                     std::optional<unsigned> maxDistance) {
    Selector selector(query, exclude);
    for (const auto& entry : entries) {
        if (entry.conversationId == conversationId) selector.offer(entry);
    }
    return selector.result(maxDistance);
}

} // namespace DupFinder
