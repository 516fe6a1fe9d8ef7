#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <pqxx/pqxx>

#include "FingerprintCorpus.hpp"

namespace DupFinder
{

/**
 * @brief Durable corpus stored in PostgreSQL.
 *
 * One row per recorded image in `image_fingerprints`, unique on
 * (chat_id, message_id). The BIGSERIAL id is the insertion sequence.
 * Concurrent callers draw connections from a fixed-size pool; a connection
 * found closed is replaced on its next checkout.
 */
class PgFingerprintCorpus : public FingerprintCorpus {
public:
    /**
     * @brief Connects and creates the schema if missing.
     * @param connectionString libpq keyword/value string or postgresql:// URI.
     * @param poolSize Maximum number of simultaneously open connections (>= 1).
     * @throws CorpusError if the database cannot be reached.
     */
    explicit PgFingerprintCorpus(const std::string& connectionString, std::size_t poolSize = 4);
    ~PgFingerprintCorpus() override;

    PgFingerprintCorpus(const PgFingerprintCorpus&) = delete;
    PgFingerprintCorpus& operator=(const PgFingerprintCorpus&) = delete;

    bool insert(const CorpusEntry& entry) override;
    void scan(ConversationId conversationId, const Visitor& visitor) const override;
    std::optional<CorpusEntry> find(ConversationId conversationId, MessageId messageId) const override;
    std::size_t count(ConversationId conversationId) const override;

    /**
     * @brief Drops and re-creates the table. Destroys every recorded fingerprint.
     */
    void resetDatabase();

private:
    /// Checked-out connection, handed back to the pool on destruction.
    class ConnectionLease {
    public:
        explicit ConnectionLease(const PgFingerprintCorpus& owner);
        ~ConnectionLease();
        pqxx::connection& operator*() { return *m_conn; }

    private:
        const PgFingerprintCorpus& m_owner;
        std::unique_ptr<pqxx::connection> m_conn;
    };

    std::unique_ptr<pqxx::connection> acquire() const;
    void release(std::unique_ptr<pqxx::connection> conn) const;
    std::unique_ptr<pqxx::connection> openConnection() const;
    void createTables();

    std::string m_connectionString;
    std::size_t m_poolSize;

    mutable std::mutex m_poolMutex;
    mutable std::condition_variable m_poolAvailable;
    mutable std::vector<std::unique_ptr<pqxx::connection>> m_idle;
    mutable std::size_t m_openCount = 0;
};

} // namespace DupFinder
