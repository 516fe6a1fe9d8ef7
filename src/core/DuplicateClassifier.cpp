#include "DuplicateClassifier.hpp"

#include "FingerprintExtractor.hpp"
#include "NearestMatchSearch.hpp"
#include "../utils/Log.hpp"

namespace DupFinder
{

std::string toString(Classification::Verdict verdict) {
    switch (verdict) {
        case Classification::Verdict::NewImage:    return "new_image";
        case Classification::Verdict::Duplicate:   return "duplicate";
        case Classification::Verdict::ManualMatch: return "manual_match";
        case Classification::Verdict::NoCorpus:    return "no_corpus";
        case Classification::Verdict::NotAnImage:  return "not_an_image";
    }
    return "unknown";
}

DuplicateClassifier::DuplicateClassifier(FingerprintCorpus& corpus, ClassifierOptions options)
    : m_corpus(corpus), m_options(options) {
    if (m_options.threshold > FINGERPRINT_BITS) {
        throw ConfigError("similarity threshold " + std::to_string(m_options.threshold) +
                          " exceeds " + std::to_string(FINGERPRINT_BITS) + " bits");
    }
}

// --- Per-conversation locks ---

DuplicateClassifier::ConversationGuard::ConversationGuard(DuplicateClassifier& owner, ConversationId conversationId)
    : m_owner(owner), m_conversationId(conversationId), m_mutex(owner.conversationLock(conversationId)) {
    m_mutex->lock();
}

DuplicateClassifier::ConversationGuard::~ConversationGuard() {
    m_mutex->unlock();
    m_owner.releaseConversationLock(m_conversationId, m_mutex);
}

std::shared_ptr<std::mutex> DuplicateClassifier::conversationLock(ConversationId conversationId) {
    std::lock_guard<std::mutex> lock(m_locksMutex);
    auto& slot = m_conversationLocks[conversationId];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void DuplicateClassifier::releaseConversationLock(ConversationId conversationId,
                                                  const std::shared_ptr<std::mutex>& mutex) {
    std::lock_guard<std::mutex> lock(m_locksMutex);
    auto it = m_conversationLocks.find(conversationId);
    // Copies are only handed out under m_locksMutex, so two owners (table and caller) means nobody waits
    if (it != m_conversationLocks.end() && it->second == mutex && mutex.use_count() == 2) {
        m_conversationLocks.erase(it);
    }
}

std::size_t DuplicateClassifier::activeConversations() const {
    std::lock_guard<std::mutex> lock(m_locksMutex);
    return m_conversationLocks.size();
}

Classification DuplicateClassifier::classifyNewImage(ConversationId conversationId,
                                                     MessageId messageId,
                                                     const std::string& label,
                                                     const std::vector<unsigned char>& bytes) {
    auto fingerprint = FingerprintExtractor::tryExtract(bytes);
    if (!fingerprint) {
        Log::warn("Error decoding image (msg id: " + std::to_string(messageId) + ") in \"" +
                  label + "\" (" + std::to_string(conversationId) + ")");
        return Classification::of(Classification::Verdict::NotAnImage);
    }
    return classifyFingerprint(conversationId, messageId, label, *fingerprint);
}

Classification DuplicateClassifier::classifyFingerprint(ConversationId conversationId,
                                                        MessageId messageId,
                                                        const std::string& label,
                                                        Fingerprint fingerprint) {
    if (!m_options.serializeConversations) {
        return searchThenRecord(conversationId, messageId, label, fingerprint);
    }

    ConversationGuard guard(*this, conversationId);
    return searchThenRecord(conversationId, messageId, label, fingerprint);
}

Classification DuplicateClassifier::searchThenRecord(ConversationId conversationId,
                                                     MessageId messageId,
                                                     const std::string& label,
                                                     Fingerprint fingerprint) {
    auto match = NearestMatchSearch::findClosest(m_corpus, conversationId, fingerprint,
                                                 std::nullopt, m_options.threshold);
    if (match) {
        Log::debug("Duplicate image in " + label + " (" + std::to_string(conversationId) +
                   "): message " + std::to_string(messageId) + " matches " +
                   std::to_string(match->messageId) + " at distance " + std::to_string(match->distance));
        return Classification::of(Classification::Verdict::Duplicate, match);
    }

    Log::debug("New image sent to " + label + " (" + std::to_string(conversationId) +
               "). Adding fingerprint to corpus");

    CorpusEntry entry;
    entry.conversationId = conversationId;
    entry.messageId = messageId;
    entry.fingerprint = fingerprint;
    entry.label = label;
    if (!m_corpus.insert(entry)) {
        Log::debug("Message " + std::to_string(messageId) + " already recorded, keeping existing entry");
    }
    return Classification::of(Classification::Verdict::NewImage);
}

Classification DuplicateClassifier::classifyManual(ConversationId conversationId,
                                                   MessageId queryMessageId,
                                                   const std::vector<unsigned char>& bytes) const {
    auto fingerprint = FingerprintExtractor::tryExtract(bytes);
    if (!fingerprint) {
        return Classification::of(Classification::Verdict::NotAnImage);
    }
    return closestTo(conversationId, queryMessageId, *fingerprint);
}

Classification DuplicateClassifier::closestTo(ConversationId conversationId,
                                              MessageId queryMessageId,
                                              Fingerprint fingerprint) const {
    auto match = NearestMatchSearch::findClosest(m_corpus, conversationId, fingerprint, queryMessageId);
    if (!match) {
        return Classification::of(Classification::Verdict::NoCorpus);
    }
    return Classification::of(Classification::Verdict::ManualMatch, match);
}

} // namespace DupFinder
