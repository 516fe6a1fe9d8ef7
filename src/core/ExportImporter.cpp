#include "ExportImporter.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>

#include "FingerprintExtractor.hpp"
#include "../utils/Log.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace DupFinder
{

namespace {

// Export fields of the wrong type (null titles, numeric types) count as absent
std::optional<std::string> stringField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

ExportImporter::ExportImporter(FingerprintCorpus& corpus, bool showProgress)
    : m_corpus(corpus), m_showProgress(showProgress) {}

void ExportImporter::printProgress(std::size_t done, std::size_t total) const {
    if (!m_showProgress || !Log::enabled(Log::Level::Info)) return;

    constexpr std::size_t width = 40;
    const std::size_t filled = total == 0 ? width : done * width / total;
    std::string bar(filled, '#');
    if (filled < width) bar += '>' + std::string(width - filled - 1, '-');

    std::cout << "\r[" << bar << "] " << done << "/" << total << std::flush;
    if (done == total) std::cout << std::endl;
}

ImportStats ExportImporter::run(const fs::path& exportPath, ConversationId conversationId) {
    std::ifstream file(exportPath);
    if (!file) {
        throw DupFinderException("cannot open export " + exportPath.string());
    }

    json data;
    try {
        data = json::parse(file);
    } catch (const json::parse_error& e) {
        throw DupFinderException("couldn't parse " + exportPath.string() + ": " + e.what());
    }

    if (!data.is_object() || !data.contains("messages") || !data["messages"].is_array()) {
        throw DupFinderException(exportPath.string() + " has no messages array");
    }

    const std::string chatTitle = stringField(data, "name").value_or("<unknown>");
    const json& messages = data["messages"];
    const fs::path basePath = exportPath.parent_path();

    ImportStats stats;
    stats.messages = messages.size();
    Log::info("Chat: '" + chatTitle + "' with " + std::to_string(stats.messages) + " messages.");

    std::size_t done = 0;
    for (const auto& msg : messages) {
        printProgress(++done, stats.messages);

        if (!msg.is_object() || stringField(msg, "type") != "message") continue;
        auto photo = stringField(msg, "photo");
        if (!photo) continue;
        if (!msg.contains("id") || !msg["id"].is_number_integer()) continue;

        ++stats.images;
        const fs::path imagePath = basePath / *photo;

        // Deleted thumbnails and "(File not included...)" placeholders end up here
        auto fingerprint = FingerprintExtractor::extractFile(imagePath);
        if (!fingerprint) {
            ++stats.skipped;
            continue;
        }

        CorpusEntry entry;
        entry.conversationId = conversationId;
        entry.messageId = msg["id"].get<MessageId>();
        entry.fingerprint = *fingerprint;
        entry.label = chatTitle;

        if (m_corpus.insert(entry)) {
            ++stats.imported;
        } else {
            ++stats.conflicts;
        }
    }

    Log::info("Import complete! " + std::to_string(stats.imported) + " imported, " +
              std::to_string(stats.skipped) + " skipped, " +
              std::to_string(stats.conflicts) + " already recorded.");
    return stats;
}

} // namespace DupFinder
