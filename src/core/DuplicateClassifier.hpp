#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "FingerprintCorpus.hpp"

namespace DupFinder
{

struct ClassifierOptions
{
    unsigned threshold{5};               ///< Max differing bits still reported as duplicate
    bool     serializeConversations{true}; ///< Run search-then-insert under a per-conversation lock
};

/**
 * @brief Outcome of one classification request.
 */
struct Classification
{
    enum class Verdict {
        NewImage,     ///< Recorded in the corpus
        Duplicate,    ///< Within threshold of `match`, not recorded
        ManualMatch,  ///< Closest entry for a manual query, any distance
        NoCorpus,     ///< Nothing to compare against
        NotAnImage    ///< Bytes could not be fingerprinted
    };

    Verdict verdict{Verdict::NotAnImage};
    std::optional<Match> match;

    static Classification of(Verdict verdict, std::optional<Match> match = std::nullopt) {
        return Classification{verdict, match};
    }
};

std::string toString(Classification::Verdict verdict);

/**
 * @brief Applies the duplicate policy on top of NearestMatchSearch.
 *
 * Automatic mode records every image that is not within `threshold` bits of
 * an earlier one. Manual mode only reports the closest entry and never writes.
 */
class DuplicateClassifier {
public:
    /**
     * @throws ConfigError if options.threshold exceeds the fingerprint width.
     */
    explicit DuplicateClassifier(FingerprintCorpus& corpus, ClassifierOptions options = {});

    /**
     * @brief Automatic mode for a freshly posted image.
     * @throws CorpusError on storage failure; nothing is retried.
     */
    Classification classifyNewImage(ConversationId conversationId,
                                    MessageId messageId,
                                    const std::string& label,
                                    const std::vector<unsigned char>& bytes);

    /**
     * @brief Manual "is this a duplicate?" query anchored at an existing message.
     *
     * The anchored message itself is excluded from the candidates.
     */
    Classification classifyManual(ConversationId conversationId,
                                  MessageId queryMessageId,
                                  const std::vector<unsigned char>& bytes) const;

    /// Automatic mode for an already computed fingerprint.
    Classification classifyFingerprint(ConversationId conversationId,
                                       MessageId messageId,
                                       const std::string& label,
                                       Fingerprint fingerprint);

    /// Manual mode for an already computed fingerprint.
    Classification closestTo(ConversationId conversationId,
                             MessageId queryMessageId,
                             Fingerprint fingerprint) const;

    unsigned threshold() const { return m_options.threshold; }

    /// Conversations with a classification in flight.
    std::size_t activeConversations() const;

private:
    /// Holds one conversation's lock; the lock is dropped from the table once unused.
    class ConversationGuard {
    public:
        ConversationGuard(DuplicateClassifier& owner, ConversationId conversationId);
        ~ConversationGuard();

    private:
        DuplicateClassifier& m_owner;
        ConversationId m_conversationId;
        std::shared_ptr<std::mutex> m_mutex;
    };

    std::shared_ptr<std::mutex> conversationLock(ConversationId conversationId);
    void releaseConversationLock(ConversationId conversationId, const std::shared_ptr<std::mutex>& mutex);
    Classification searchThenRecord(ConversationId conversationId,
                                    MessageId messageId,
                                    const std::string& label,
                                    Fingerprint fingerprint);

    FingerprintCorpus& m_corpus;
    ClassifierOptions m_options;

    mutable std::mutex m_locksMutex;
    std::map<ConversationId, std::shared_ptr<std::mutex>> m_conversationLocks;
};

} // namespace DupFinder
