#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "FingerprintCorpus.hpp"

namespace DupFinder
{

struct ImportStats
{
    std::size_t messages{0};   ///< Messages in the export
    std::size_t images{0};     ///< Messages carrying a photo
    std::size_t imported{0};   ///< New corpus entries
    std::size_t skipped{0};    ///< Photos missing on disk or not decodable
    std::size_t conflicts{0};  ///< Photos whose message id was already recorded
};

/**
 * @brief Seeds the corpus from a chat history export (result.json).
 *
 * Every photo message is fingerprinted and recorded as is, without duplicate
 * classification, so a conversation's history can be loaded before the live
 * feed starts. Photo paths are resolved relative to the export file.
 */
class ExportImporter {
public:
    explicit ExportImporter(FingerprintCorpus& corpus, bool showProgress = true);

    /**
     * @param exportPath Path to result.json.
     * @param conversationId Chat id as seen by the live feed, which may differ
     *        from the id stored in the export.
     * @throws DupFinderException if the export cannot be read or parsed.
     * @throws CorpusError on storage failure.
     */
    ImportStats run(const std::filesystem::path& exportPath, ConversationId conversationId);

private:
    void printProgress(std::size_t done, std::size_t total) const;

    FingerprintCorpus& m_corpus;
    bool m_showProgress;
};

} // namespace DupFinder
