#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

#include "core/DuplicateClassifier.hpp"
#include "core/ExportImporter.hpp"
#include "core/MemoryCorpus.hpp"
#include "core/PgFingerprintCorpus.hpp"
#include "utils/ArgParser.h"
#include "utils/Config.hpp"
#include "utils/ConversationId.hpp"
#include "utils/Log.hpp"

using namespace DupFinder;

namespace {

std::vector<unsigned char> readBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DupFinderException("cannot open " + path);
    }
    return std::vector<unsigned char>((std::istreambuf_iterator<char>(file)),
                                      std::istreambuf_iterator<char>());
}

int runCheck(DuplicateClassifier& classifier, const ArgParser::Arguments& args) {
    const ConversationId chatId = args.intArgs.at("chat_id");
    const MessageId messageId = args.intArgs.at("message_id");

    auto result = classifier.classifyNewImage(chatId, messageId, args.stringArgs.at("label"),
                                              readBytes(args.stringArgs.at("input_path")));

    if (result.verdict == Classification::Verdict::Duplicate) {
        std::cout << "duplicate image (dst " << result.match->distance << ").\n"
                  << messageLink(chatId, result.match->messageId) << std::endl;
    } else {
        std::cout << toString(result.verdict) << std::endl;
    }
    return 0;
}

int runQuery(const DuplicateClassifier& classifier, const ArgParser::Arguments& args) {
    const ConversationId chatId = args.intArgs.at("chat_id");

    auto result = classifier.classifyManual(chatId, args.intArgs.at("message_id"),
                                            readBytes(args.stringArgs.at("input_path")));

    if (result.verdict == Classification::Verdict::ManualMatch) {
        std::cout << "closest match (dst " << result.match->distance << ").\n"
                  << messageLink(chatId, result.match->messageId) << std::endl;
    } else {
        std::cout << toString(result.verdict) << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    ArgParser::Arguments args;
    try {
        ArgParser parser;
        args = parser.parseArgs(argc, argv);
    } catch (const std::runtime_error& e) {
        return std::string(e.what()) == "Help displayed." ? 0 : 2;
    }

    if (args.command == "display_id") {
        std::cout << toDisplayId(args.intArgs.at("chat_id")) << std::endl;
        return 0;
    }

    try {
        Settings settings = Settings::load(args.configPath);
        Log::Level level = Log::Level::Info;
        Log::parseLevel(settings.logLevel, level);
        Log::setLevel(level);

        if (args.command == "import" && args.boolArgs.at("dry_run")) {
            Log::info("Dry run: importing into memory, the database is not touched.");
            MemoryCorpus corpus;
            ExportImporter importer(corpus);
            importer.run(args.stringArgs.at("input_path"), args.intArgs.at("chat_id"));
            return 0;
        }

        Log::info("Configuration loaded. Connecting to database...");
        PgFingerprintCorpus corpus(settings.connectionString(), settings.database.poolSize);
        Log::info("Database connected.");

        if (args.command == "import") {
            Log::info("Starting import from: " + args.stringArgs.at("input_path"));
            ExportImporter importer(corpus);
            importer.run(args.stringArgs.at("input_path"), args.intArgs.at("chat_id"));
            return 0;
        }

        ClassifierOptions options;
        options.threshold = settings.similarityThreshold;
        options.serializeConversations = settings.serializeConversations;
        DuplicateClassifier classifier(corpus, options);

        if (args.command == "check") return runCheck(classifier, args);
        if (args.command == "query") return runQuery(classifier, args);

        Log::error("Unhandled command: " + args.command);
        return 2;
    } catch (const ConfigError& e) {
        Log::error(e.what());
        return 3;
    } catch (const CorpusError& e) {
        Log::error(e.what());
        return 4;
    } catch (const std::exception& e) {
        Log::error(e.what());
        return 1;
    }
}
