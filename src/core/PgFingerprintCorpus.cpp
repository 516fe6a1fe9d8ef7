#include "PgFingerprintCorpus.hpp"

#include "../utils/Log.hpp"

namespace DupFinder
{

namespace {

// Fingerprints live in a signed BIGINT column; the bit pattern is kept as is
std::int64_t toColumn(Fingerprint fp) { return static_cast<std::int64_t>(fp); }
Fingerprint fromColumn(std::int64_t value) { return static_cast<Fingerprint>(value); }

} // namespace

// --- Connection pool ---

PgFingerprintCorpus::ConnectionLease::ConnectionLease(const PgFingerprintCorpus& owner)
    : m_owner(owner), m_conn(owner.acquire()) {}

PgFingerprintCorpus::ConnectionLease::~ConnectionLease() {
    m_owner.release(std::move(m_conn));
}

std::unique_ptr<pqxx::connection> PgFingerprintCorpus::openConnection() const {
    try {
        auto conn = std::make_unique<pqxx::connection>(m_connectionString);
        if (!conn->is_open()) {
            throw CorpusError("connection object not open");
        }
        return conn;
    } catch (const pqxx::failure& e) {
        throw CorpusError(std::string("cannot connect to database: ") + e.what());
    }
}

std::unique_ptr<pqxx::connection> PgFingerprintCorpus::acquire() const {
    std::unique_lock<std::mutex> lock(m_poolMutex);
    m_poolAvailable.wait(lock, [this] { return !m_idle.empty() || m_openCount < m_poolSize; });

    if (!m_idle.empty()) {
        auto conn = std::move(m_idle.back());
        m_idle.pop_back();
        if (conn->is_open()) return conn;

        // Dropped by the server while idle; reuse its slot
        Log::warn("Replacing closed database connection");
        --m_openCount;
    }

    ++m_openCount;
    lock.unlock();
    try {
        return openConnection();
    } catch (...) {
        lock.lock();
        --m_openCount;
        m_poolAvailable.notify_one();
        throw;
    }
}

void PgFingerprintCorpus::release(std::unique_ptr<pqxx::connection> conn) const {
    {
        std::lock_guard<std::mutex> lock(m_poolMutex);
        if (conn && conn->is_open()) {
            m_idle.push_back(std::move(conn));
        } else {
            --m_openCount;
        }
    }
    m_poolAvailable.notify_one();
}

// --- Schema ---

PgFingerprintCorpus::PgFingerprintCorpus(const std::string& connectionString, std::size_t poolSize)
    : m_connectionString(connectionString), m_poolSize(poolSize == 0 ? 1 : poolSize) {
    createTables();
}

PgFingerprintCorpus::~PgFingerprintCorpus() {
    std::lock_guard<std::mutex> lock(m_poolMutex);
    for (auto& conn : m_idle) {
        if (conn && conn->is_open()) conn->close();
    }
}

void PgFingerprintCorpus::createTables() {
    ConnectionLease conn(*this);
    try {
        pqxx::work txn(*conn);
        txn.exec("CREATE TABLE IF NOT EXISTS image_fingerprints ("
                 "id BIGSERIAL PRIMARY KEY, "
                 "chat_id BIGINT NOT NULL, "
                 "message_id BIGINT NOT NULL, "
                 "fingerprint BIGINT NOT NULL, "
                 "label TEXT NOT NULL DEFAULT '', "
                 "inserted_at TIMESTAMP WITHOUT TIME ZONE NOT NULL DEFAULT NOW(), "
                 "UNIQUE (chat_id, message_id));");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_image_fingerprints_chat ON image_fingerprints (chat_id);");
        txn.commit();
        Log::debug("Schema ready on database " + std::string((*conn).dbname()));
    } catch (const pqxx::failure& e) {
        throw CorpusError(std::string("table creation failed: ") + e.what());
    }
}

void PgFingerprintCorpus::resetDatabase() {
    {
        ConnectionLease conn(*this);
        try {
            pqxx::work txn(*conn);
            txn.exec("DROP TABLE IF EXISTS image_fingerprints CASCADE;");
            txn.commit();
        } catch (const pqxx::failure& e) {
            throw CorpusError(std::string("database reset failed: ") + e.what());
        }
    }
    createTables();
}

// --- Access ---

bool PgFingerprintCorpus::insert(const CorpusEntry& entry) {
    ConnectionLease conn(*this);
    try {
        pqxx::work txn(*conn);
        pqxx::result res = txn.exec_params(
            "INSERT INTO image_fingerprints (chat_id, message_id, fingerprint, label) "
            "VALUES ($1, $2, $3, $4) "
            "ON CONFLICT (chat_id, message_id) DO NOTHING",
            entry.conversationId,
            entry.messageId,
            toColumn(entry.fingerprint),
            entry.label);
        txn.commit();
        return res.affected_rows() == 1;
    } catch (const pqxx::failure& e) {
        throw CorpusError(std::string("insert failed: ") + e.what());
    }
}

void PgFingerprintCorpus::scan(ConversationId conversationId, const Visitor& visitor) const {
    ConnectionLease conn(*this);
    try {
        pqxx::read_transaction txn(*conn);
        const std::string sql =
            "SELECT id, message_id, fingerprint, label FROM image_fingerprints "
            "WHERE chat_id = " + txn.quote(conversationId);

        // Rows are streamed, not buffered, so large conversations stay cheap
        for (auto [id, messageId, fingerprint, label] :
                 txn.stream<std::int64_t, std::int64_t, std::int64_t, std::string>(sql)) {
            CorpusEntry entry;
            entry.conversationId = conversationId;
            entry.messageId = messageId;
            entry.fingerprint = fromColumn(fingerprint);
            entry.label = std::move(label);
            entry.sequence = id;
            visitor(entry);
        }
        txn.commit();
    } catch (const pqxx::failure& e) {
        throw CorpusError(std::string("scan failed: ") + e.what());
    }
}

std::optional<CorpusEntry> PgFingerprintCorpus::find(ConversationId conversationId, MessageId messageId) const {
    ConnectionLease conn(*this);
    try {
        pqxx::read_transaction txn(*conn);
        pqxx::result res = txn.exec_params(
            "SELECT id, fingerprint, label FROM image_fingerprints "
            "WHERE chat_id = $1 AND message_id = $2",
            conversationId, messageId);
        txn.commit();

        if (res.empty()) return std::nullopt;

        CorpusEntry entry;
        entry.conversationId = conversationId;
        entry.messageId = messageId;
        entry.sequence = res[0]["id"].as<std::int64_t>();
        entry.fingerprint = fromColumn(res[0]["fingerprint"].as<std::int64_t>());
        entry.label = res[0]["label"].as<std::string>();
        return entry;
    } catch (const pqxx::failure& e) {
        throw CorpusError(std::string("lookup failed: ") + e.what());
    }
}

std::size_t PgFingerprintCorpus::count(ConversationId conversationId) const {
    ConnectionLease conn(*this);
    try {
        pqxx::read_transaction txn(*conn);
        pqxx::result res = txn.exec_params(
            "SELECT COUNT(*) FROM image_fingerprints WHERE chat_id = $1", conversationId);
        txn.commit();
        return static_cast<std::size_t>(res[0][0].as<std::int64_t>());
    } catch (const pqxx::failure& e) {
        throw CorpusError(std::string("count failed: ") + e.what());
    }
}

} // namespace DupFinder
