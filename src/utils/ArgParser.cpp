#include "ArgParser.h"
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace std;

namespace DupFinder
{

// --- Helper Functions ---

// Function to check if a required argument is present
static bool checkRequired(const cxxopts::ParseResult& result, const std::string& name, const std::string& command) {
    if (!result.count(name)) {
        cerr << "Argument error: --" << name << " is required for command '" << command << "'" << endl;
        return false;
    }
    return true;
}

static const std::vector<std::string>& requiredArgs(const std::string& command) {
    static const std::map<std::string, std::vector<std::string>> required = {
        {"import",     {"input_path", "chat_id"}},
        {"check",      {"input_path", "chat_id", "message_id"}},
        {"query",      {"input_path", "chat_id", "message_id"}},
        {"display_id", {"chat_id"}},
    };
    return required.at(command);
}

// --- ArgParser Implementation ---

ArgParser::ArgParser()
    : m_options("dupfinder", "Near-duplicate image detection for chat conversations.")
{
    // The first pass only looks for the command word; everything else is left
    // for the command-specific parser.
    m_options.add_options()
        ("command", "Command to execute (import, check, query, display_id)", cxxopts::value<std::string>());
    addCommonArgs(m_options);
    m_options.parse_positional({"command"});
    m_options.allow_unrecognised_options();
}

void ArgParser::addCommonArgs(cxxopts::Options& options) {
    options.add_options()
        ("c,config", "Path to the JSON configuration file", cxxopts::value<std::string>()->default_value("config.json"))
        ("h,help", "Display this help menu");
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    try {
        auto result = m_options.parse(argc, argv);
        std::string command = result.count("command") ? result["command"].as<std::string>() : "";

        if (result.count("help")) {
            cxxopts::Options commandOptions("dupfinder " + command, "Arguments for " + command);
            if (!command.empty() && addCommandArgs(command, commandOptions)) {
                addCommonArgs(commandOptions);
                std::cout << commandOptions.help() << std::endl;
            } else {
                std::cout << m_options.help() << std::endl;
            }
            throw std::runtime_error("Help displayed.");
        }

        if (command.empty()) {
            std::cout << m_options.help() << std::endl;
            throw std::runtime_error("No command specified.");
        }

        cxxopts::Options commandOptions("dupfinder " + command, "Arguments for " + command);
        if (!addCommandArgs(command, commandOptions)) {
            cerr << "Argument error: unknown command '" << command
                 << "' (expected import, check, query or display_id)" << endl;
            throw std::runtime_error("Unknown command: " + command);
        }
        addCommonArgs(commandOptions);
        commandOptions.add_options()("command", "", cxxopts::value<std::string>());
        commandOptions.parse_positional({"command"});

        // Re-parse for the specific command options
        auto finalResult = commandOptions.parse(argc, argv);

        bool complete = true;
        for (const auto& name : requiredArgs(command)) {
            complete = checkRequired(finalResult, name, command) && complete;
        }
        if (!complete) throw std::runtime_error("Missing required args.");

        return mapResults(finalResult, command);

    } catch (const std::runtime_error&) {
        throw;
    } catch (const std::exception& e) {
        // cxxopts reports its own errors outside the runtime_error hierarchy
        cerr << "Error parsing arguments: " << e.what() << endl;
        throw std::runtime_error(e.what());
    }
}

bool ArgParser::addCommandArgs(const std::string& command, cxxopts::Options& options) {
    if (command == "import") addImportArgs(options);
    else if (command == "check") addCheckArgs(options);
    else if (command == "query") addQueryArgs(options);
    else if (command == "display_id") addDisplayIdArgs(options);
    else return false;
    return true;
}

void ArgParser::addImportArgs(cxxopts::Options& options) {
    options.add_options()
        ("input_path", "Path to the chat export's result.json file", cxxopts::value<std::string>())
        ("chat_id", "The BOT-FACING chat id (may differ from the one in the export); use --chat_id=-100...", cxxopts::value<std::int64_t>())
        ("dry_run", "Fingerprint the export into memory only; the database is not touched");
}

void ArgParser::addCheckArgs(cxxopts::Options& options) {
    options.add_options()
        ("input_path", "Path to the image to classify", cxxopts::value<std::string>())
        ("chat_id", "Chat the image was posted in", cxxopts::value<std::int64_t>())
        ("message_id", "Message that carried the image", cxxopts::value<std::int64_t>())
        ("label", "Human-readable chat title", cxxopts::value<std::string>()->default_value("<unknown>"));
}

void ArgParser::addQueryArgs(cxxopts::Options& options) {
    options.add_options()
        ("input_path", "Path to the image of the referenced message", cxxopts::value<std::string>())
        ("chat_id", "Chat to search", cxxopts::value<std::int64_t>())
        ("message_id", "Referenced message (excluded from the candidates)", cxxopts::value<std::int64_t>());
}

void ArgParser::addDisplayIdArgs(cxxopts::Options& options) {
    options.add_options()
        ("chat_id", "Internal chat id to convert", cxxopts::value<std::int64_t>());
}

ArgParser::Arguments ArgParser::mapResults(const cxxopts::ParseResult& result, const std::string& command) {
    Arguments args;
    args.command = command;
    args.configPath = result["config"].as<std::string>();

    args.intArgs["chat_id"] = result["chat_id"].as<std::int64_t>();

    if (command == "import" || command == "check" || command == "query") {
        args.stringArgs["input_path"] = result["input_path"].as<std::string>();
    }
    if (command == "import") {
        args.boolArgs["dry_run"] = result.count("dry_run") > 0;
    }
    if (command == "check" || command == "query") {
        args.intArgs["message_id"] = result["message_id"].as<std::int64_t>();
    }
    if (command == "check") {
        args.stringArgs["label"] = result["label"].as<std::string>();
    }
    return args;
}

} // namespace DupFinder
