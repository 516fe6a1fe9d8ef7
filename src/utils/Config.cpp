#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "Log.hpp"
#include "../core/Common.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace DupFinder
{

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

// libpq keyword/value syntax: single-quoted, with \ and ' backslash-escaped
std::string quoteConnectionValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\\' || c == '\'') quoted += '\\';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

long long parseInteger(const std::string& key, const std::string& text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::exception&) {
        throw ConfigError(key + " must be an integer, got '" + text + "'");
    }
}

bool parseBool(const std::string& key, const std::string& text) {
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(),
        [](unsigned char c){ return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(key + " must be a boolean, got '" + text + "'");
}

unsigned toThreshold(long long value) {
    if (value < 0 || value > static_cast<long long>(FINGERPRINT_BITS)) {
        throw ConfigError("similarity_threshold must be between 0 and " +
                          std::to_string(FINGERPRINT_BITS) + ", got " + std::to_string(value));
    }
    return static_cast<unsigned>(value);
}

std::size_t toPoolSize(long long value) {
    if (value < 1) {
        throw ConfigError("database.pool_size must be at least 1, got " + std::to_string(value));
    }
    return static_cast<std::size_t>(value);
}

} // namespace

Settings Settings::fromJson(const std::string& text) {
    Settings settings;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw ConfigError("top-level JSON value must be an object");
        }

        if (j.contains("database")) {
            const json& db = j.at("database");
            settings.database.url = db.value("url", settings.database.url);
            if (db.contains("pool_size")) {
                settings.database.poolSize = toPoolSize(db.at("pool_size").get<long long>());
            }
        }
        if (j.contains("similarity_threshold")) {
            settings.similarityThreshold = toThreshold(j.at("similarity_threshold").get<long long>());
        }
        settings.logLevel = j.value("log_level", settings.logLevel);
        settings.serializeConversations = j.value("serialize_conversations", settings.serializeConversations);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    return settings;
}

Settings Settings::load(const fs::path& configPath) {
    Settings settings;
    if (!configPath.empty() && fs::exists(configPath)) {
        std::ifstream file(configPath);
        if (!file) {
            throw ConfigError("cannot read " + configPath.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        settings = fromJson(buffer.str());
        Log::debug("Loaded configuration from " + configPath.string());
    }

    settings.applyEnvironment();
    settings.validate();
    return settings;
}

void Settings::applyEnvironment() {
    if (const char* url = std::getenv("DUPFINDER_DATABASE_URL")) {
        database.url = url;
    }
    if (const char* pool = std::getenv("DUPFINDER_DATABASE_POOL_SIZE")) {
        database.poolSize = toPoolSize(parseInteger("DUPFINDER_DATABASE_POOL_SIZE", pool));
    }
    if (const char* threshold = std::getenv("DUPFINDER_SIMILARITY_THRESHOLD")) {
        similarityThreshold = toThreshold(parseInteger("DUPFINDER_SIMILARITY_THRESHOLD", threshold));
    }
    if (const char* level = std::getenv("DUPFINDER_LOG_LEVEL")) {
        logLevel = level;
    }
    if (const char* serialize = std::getenv("DUPFINDER_SERIALIZE_CONVERSATIONS")) {
        serializeConversations = parseBool("DUPFINDER_SERIALIZE_CONVERSATIONS", serialize);
    }
}

void Settings::validate() const {
    toThreshold(similarityThreshold);
    toPoolSize(static_cast<long long>(database.poolSize));

    Log::Level level;
    if (!Log::parseLevel(logLevel, level)) {
        throw ConfigError("unknown log_level '" + logLevel + "'");
    }
}

std::string Settings::connectionString() const {
    if (!database.url.empty()) {
        return database.url;
    }

    std::string n = envOr("DB_NAME", "");
    std::string u = envOr("DB_USER", "");
    std::string p = envOr("DB_PASSWORD", "");
    std::string h = envOr("DB_HOST", "localhost");
    std::string po = envOr("DB_PORT", "5432");

    std::string conn = "host=" + quoteConnectionValue(h) + " port=" + quoteConnectionValue(po);
    if (!n.empty()) conn += " dbname=" + quoteConnectionValue(n);
    if (!u.empty()) conn += " user=" + quoteConnectionValue(u);
    if (!p.empty()) conn += " password=" + quoteConnectionValue(p);
    return conn;
}

} // namespace DupFinder
