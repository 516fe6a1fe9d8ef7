#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace DupFinder
{

struct DatabaseSettings
{
    std::string url;          ///< libpq connection string or URI
    std::size_t poolSize{4};
};

/**
 * @brief Deployment settings.
 *
 * Loaded from an optional JSON file, then overridden by DUPFINDER_* variables:
 *
 * {
 *   "database": { "url": "postgresql://bot@localhost/dupfinder", "pool_size": 4 },
 *   "similarity_threshold": 5,
 *   "log_level": "info",
 *   "serialize_conversations": true
 * }
 */
struct Settings
{
    DatabaseSettings database;
    unsigned similarityThreshold{5};
    std::string logLevel{"info"};
    bool serializeConversations{true};

    /**
     * @brief Reads `configPath` (skipped if it does not exist) and the environment.
     * @throws ConfigError on malformed JSON or out-of-range values.
     */
    static Settings load(const std::filesystem::path& configPath);

    /**
     * @brief Parses a JSON document; keys that are absent keep their defaults.
     */
    static Settings fromJson(const std::string& text);

    /// Applies DUPFINDER_* overrides on top of the current values.
    void applyEnvironment();

    /// Throws ConfigError on out-of-range values.
    void validate() const;

    /**
     * @brief Database connection string; falls back to DB_NAME, DB_USER,
     * DB_PASSWORD, DB_HOST and DB_PORT when no url is configured.
     */
    std::string connectionString() const;
};

} // namespace DupFinder
