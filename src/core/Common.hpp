#pragma once

#include <bitset>
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Shared types and errors for the duplicate finder.
 */
namespace DupFinder
{
    using Fingerprint    = std::uint64_t;
    using ConversationId = std::int64_t;
    using MessageId      = std::int64_t;

    /// Width of every fingerprint produced by the extractor.
    constexpr unsigned FINGERPRINT_BITS = 64;

    /**
     * @brief One recorded image of a conversation.
     *
     * Keyed by (conversationId, messageId). `sequence` is assigned by the
     * corpus on insert and orders entries by insertion time.
     */
    struct CorpusEntry
    {
        ConversationId conversationId{0};
        MessageId      messageId{0};
        Fingerprint    fingerprint{0};
        std::string    label;           ///< Conversation title, diagnostics only
        std::int64_t   sequence{0};
    };

    /**
     * @brief Closest corpus entry for a query fingerprint.
     */
    struct Match
    {
        MessageId messageId{0};
        unsigned  distance{0};

        bool operator==(const Match& other) const noexcept {
            return messageId == other.messageId && distance == other.distance;
        }
    };

    /**
     * @brief Number of differing bits between two fingerprints (0..64).
     */
    inline unsigned hammingDistance(Fingerprint a, Fingerprint b) noexcept {
        return static_cast<unsigned>(std::bitset<FINGERPRINT_BITS>(a ^ b).count());
    }

    /**
     * @brief Base exception for all duplicate finder errors.
     */
    class DupFinderException : public std::runtime_error {
    public:
        explicit DupFinderException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief The bytes could not be decoded as an image.
     */
    class ExtractionError : public DupFinderException {
    public:
        explicit ExtractionError(const std::string& message)
            : DupFinderException("Unsupported or corrupt image: " + message) {}
    };

    /**
     * @brief The corpus storage failed (connectivity, constraint, query error).
     */
    class CorpusError : public DupFinderException {
    public:
        explicit CorpusError(const std::string& message)
            : DupFinderException("Corpus error: " + message) {}
    };

    class ConfigError : public DupFinderException {
    public:
        explicit ConfigError(const std::string& message)
            : DupFinderException("Configuration error: " + message) {}
    };

} // namespace DupFinder
