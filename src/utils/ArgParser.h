#ifndef DUPFINDER_ARG_PARSER_H
#define DUPFINDER_ARG_PARSER_H

#include <cstdint>
#include <map>
#include <string>
#include <cxxopts.hpp>

namespace DupFinder
{

/**
 * @brief Command line parser for the dupfinder front-end, built on cxxopts.
 *
 * The first positional argument selects the command (import, check, query,
 * display_id); the command's own options are then parsed in a second pass.
 */
class ArgParser {
public:
    /**
     * @brief Parsed command and its options.
     */
    struct Arguments {
        std::string command;
        std::string configPath;
        std::map<std::string, std::string> stringArgs;
        std::map<std::string, std::int64_t> intArgs;
        std::map<std::string, bool> boolArgs;
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @throws std::runtime_error on help requests, unknown commands or missing options.
     */
    Arguments parseArgs(int argc, char** argv);

private:
    cxxopts::Options m_options;

    /**
     * @brief Options shared by every command (--config, --help).
     */
    static void addCommonArgs(cxxopts::Options& options);

    /**
     * @brief Adds arguments specific to the 'import' command.
     */
    static void addImportArgs(cxxopts::Options& options);

    /**
     * @brief Adds arguments specific to the 'check' command.
     */
    static void addCheckArgs(cxxopts::Options& options);

    /**
     * @brief Adds arguments specific to the 'query' command.
     */
    static void addQueryArgs(cxxopts::Options& options);

    static void addDisplayIdArgs(cxxopts::Options& options);

    /// False if `command` is not a known command.
    static bool addCommandArgs(const std::string& command, cxxopts::Options& options);

    /**
     * @brief Extracts and maps results from cxxopts::ParseResult into the Arguments structure.
     */
    static Arguments mapResults(const cxxopts::ParseResult& result, const std::string& command);
};

} // namespace DupFinder

#endif // DUPFINDER_ARG_PARSER_H
