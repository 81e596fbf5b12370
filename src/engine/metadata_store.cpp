#include "metadata_store.hpp"
#include "tessera/errors.hpp"
#include <iostream>
#include <chrono>

namespace tessera::engine {

    namespace {

        int64_t to_epoch(TimePoint tp) {
            return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
        }

        TimePoint from_epoch(int64_t seconds) {
            return TimePoint(std::chrono::seconds(seconds));
        }

        bool is_busy(int rc) {
            return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
        }

        // Finalizes on scope exit so a throwing bind/step never leaks the statement.
        class Statement {
        public:
            Statement(sqlite3* db, const char* sql) : m_db(db) {
                int rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
                if (rc != SQLITE_OK) {
                    throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db), is_busy(rc));
                }
            }
            ~Statement() { sqlite3_finalize(m_stmt); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            void bind(int idx, int64_t value) { sqlite3_bind_int64(m_stmt, idx, value); }
            void bind(int idx, int value) { sqlite3_bind_int(m_stmt, idx, value); }
            void bind(int idx, const std::string& value) {
                sqlite3_bind_text(m_stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
            }
            void bind_null(int idx) { sqlite3_bind_null(m_stmt, idx); }

            // true while rows remain
            bool step() {
                int rc = sqlite3_step(m_stmt);
                if (rc == SQLITE_ROW) return true;
                if (rc == SQLITE_DONE) return false;
                throw StoreError(std::string("step failed: ") + sqlite3_errmsg(m_db), is_busy(rc));
            }

            void reset() {
                sqlite3_reset(m_stmt);
                sqlite3_clear_bindings(m_stmt);
            }

            int64_t int64(int col) const { return sqlite3_column_int64(m_stmt, col); }
            int integer(int col) const { return sqlite3_column_int(m_stmt, col); }
            bool is_null(int col) const { return sqlite3_column_type(m_stmt, col) == SQLITE_NULL; }
            std::string text(int col) const {
                auto p = sqlite3_column_text(m_stmt, col);
                return p ? std::string(reinterpret_cast<const char*>(p), sqlite3_column_bytes(m_stmt, col)) : std::string();
            }
            std::optional<TimePoint> time(int col) const {
                if (is_null(col)) return std::nullopt;
                return from_epoch(int64(col));
            }

        private:
            sqlite3* m_db;
            sqlite3_stmt* m_stmt = nullptr;
        };

        constexpr const char* kChunkColumns =
            "SELECT id, tenant_id, document_id, chunk_index, chunk_text, source_id, version, "
            "vector_id, is_deprecated, last_updated_at, created_at FROM document_chunks ";

        DocumentChunk read_chunk(const Statement& stmt) {
            DocumentChunk chunk;
            chunk.id = stmt.int64(0);
            chunk.tenant_id = stmt.int64(1);
            chunk.document_id = stmt.int64(2);
            chunk.chunk_index = stmt.integer(3);
            chunk.chunk_text = stmt.text(4);
            chunk.source_id = stmt.text(5);
            chunk.version = stmt.integer(6);
            if (!stmt.is_null(7)) chunk.vector_id = stmt.int64(7);
            chunk.is_deprecated = stmt.integer(8) != 0;
            chunk.last_updated_at = stmt.time(9);
            chunk.created_at = stmt.time(10).value_or(TimePoint{});
            return chunk;
        }

        Document read_document(const Statement& stmt) {
            Document doc;
            doc.id = stmt.int64(0);
            doc.tenant_id = stmt.int64(1);
            doc.knowledge_source_id = stmt.int64(2);
            doc.source_id = stmt.text(3);
            doc.version = stmt.integer(4);
            doc.file_path = stmt.text(5);
            doc.file_type = stmt.text(6);
            doc.file_size = stmt.int64(7);
            doc.created_at = stmt.time(8).value_or(TimePoint{});
            doc.updated_at = stmt.time(9);
            doc.last_updated_at = stmt.time(10);
            return doc;
        }

    }

    MetadataStore::MetadataStore() = default;
    MetadataStore::~MetadataStore() { close(); }

    bool MetadataStore::open(const std::filesystem::path& path) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        if (path != ":memory:" && path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::cerr << "[MetadataStore] Failed to open: " << sqlite3_errmsg(m_db) << "\n";
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        sqlite3_busy_timeout(m_db, 5000);
        return initialize_schema();
    }

    void MetadataStore::close() {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool MetadataStore::is_open() const {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        return m_db != nullptr;
    }

    void MetadataStore::exec(const char* sql) {
        char* err_msg = nullptr;
        int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string message = err_msg ? err_msg : sqlite3_errmsg(m_db);
            sqlite3_free(err_msg);
            throw StoreError(message, is_busy(rc));
        }
    }

    bool MetadataStore::initialize_schema() {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        const char* sql =
            "PRAGMA foreign_keys = ON;"
            "CREATE TABLE IF NOT EXISTS knowledge_sources ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  tenant_id INTEGER NOT NULL,"
            "  source_type TEXT NOT NULL,"
            "  source_id TEXT NOT NULL,"
            "  name TEXT NOT NULL,"
            "  created_at INTEGER NOT NULL,"
            "  updated_at INTEGER,"
            "  UNIQUE(tenant_id, source_id)"
            ");"
            "CREATE TABLE IF NOT EXISTS documents ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  tenant_id INTEGER NOT NULL,"
            "  knowledge_source_id INTEGER NOT NULL REFERENCES knowledge_sources(id),"
            "  source_id TEXT NOT NULL,"
            "  version INTEGER NOT NULL DEFAULT 1,"
            "  file_path TEXT,"
            "  file_type TEXT,"
            "  file_size INTEGER,"
            "  created_at INTEGER NOT NULL,"
            "  updated_at INTEGER,"
            "  last_updated_at INTEGER,"
            "  UNIQUE(tenant_id, source_id, version)"
            ");"
            "CREATE TABLE IF NOT EXISTS document_chunks ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  tenant_id INTEGER NOT NULL,"
            "  document_id INTEGER NOT NULL REFERENCES documents(id),"
            "  chunk_index INTEGER NOT NULL,"
            "  chunk_text TEXT NOT NULL,"
            "  vector_id INTEGER,"
            "  source_id TEXT NOT NULL,"
            "  version INTEGER NOT NULL,"
            "  last_updated_at INTEGER,"
            "  is_deprecated INTEGER NOT NULL DEFAULT 0,"
            "  created_at INTEGER NOT NULL,"
            "  UNIQUE(document_id, chunk_index)"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_chunks_tenant ON document_chunks(tenant_id);"
            "CREATE INDEX IF NOT EXISTS idx_chunks_source ON document_chunks(tenant_id, source_id);"
            "CREATE INDEX IF NOT EXISTS idx_chunks_document ON document_chunks(document_id);";
        try {
            exec(sql);
        } catch (const StoreError& e) {
            std::cerr << "[MetadataStore] Schema error: " << e.what() << "\n";
            return false;
        }
        return true;
    }

    MetadataStore::Transaction::Transaction(MetadataStore& store)
        : m_store(store), m_lock(store.m_mutex) {
        m_store.exec("BEGIN IMMEDIATE;");
    }

    MetadataStore::Transaction::~Transaction() {
        if (m_done) return;
        char* err_msg = nullptr;
        if (sqlite3_exec(m_store.m_db, "ROLLBACK;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[MetadataStore] Rollback failed: " << (err_msg ? err_msg : "unknown") << "\n";
        }
        sqlite3_free(err_msg);
    }

    void MetadataStore::Transaction::commit() {
        m_store.exec("COMMIT;");
        m_done = true;
    }

    std::optional<KnowledgeSource> MetadataStore::find_source(int64_t tenant_id, const std::string& source_id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(m_db,
            "SELECT id, tenant_id, source_type, source_id, name, created_at, updated_at "
            "FROM knowledge_sources WHERE tenant_id = ? AND source_id = ?;");
        stmt.bind(1, tenant_id);
        stmt.bind(2, source_id);
        if (!stmt.step()) return std::nullopt;

        KnowledgeSource source;
        source.id = stmt.int64(0);
        source.tenant_id = stmt.int64(1);
        source.source_type = parse_source_type(stmt.text(2)).value_or(SourceType::Api);
        source.source_id = stmt.text(3);
        source.name = stmt.text(4);
        source.created_at = stmt.time(5).value_or(TimePoint{});
        source.updated_at = stmt.time(6);
        return source;
    }

    KnowledgeSource MetadataStore::find_or_create_source(int64_t tenant_id, SourceType type,
                                                         const std::string& source_id, const std::string& name) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        if (auto existing = find_source(tenant_id, source_id)) return *existing;

        Statement stmt(m_db,
            "INSERT INTO knowledge_sources (tenant_id, source_type, source_id, name, created_at) "
            "VALUES (?, ?, ?, ?, ?);");
        auto now = Clock::now();
        stmt.bind(1, tenant_id);
        stmt.bind(2, to_string(type));
        stmt.bind(3, source_id);
        stmt.bind(4, name);
        stmt.bind(5, to_epoch(now));
        stmt.step();

        KnowledgeSource source;
        source.id = sqlite3_last_insert_rowid(m_db);
        source.tenant_id = tenant_id;
        source.source_type = type;
        source.source_id = source_id;
        source.name = name;
        source.created_at = from_epoch(to_epoch(now));
        return source;
    }

    std::optional<Document> MetadataStore::find_document(int64_t tenant_id, const std::string& source_id, int version) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(m_db,
            "SELECT id, tenant_id, knowledge_source_id, source_id, version, file_path, file_type, file_size, "
            "created_at, updated_at, last_updated_at "
            "FROM documents WHERE tenant_id = ? AND source_id = ? AND version = ?;");
        stmt.bind(1, tenant_id);
        stmt.bind(2, source_id);
        stmt.bind(3, version);
        if (!stmt.step()) return std::nullopt;
        return read_document(stmt);
    }

    Document MetadataStore::create_document(const IngestRequest& request, int64_t knowledge_source_id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(m_db,
            "INSERT INTO documents (tenant_id, knowledge_source_id, source_id, version, file_path, file_type, "
            "file_size, created_at, last_updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
        auto now = to_epoch(Clock::now());
        stmt.bind(1, request.tenant_id);
        stmt.bind(2, knowledge_source_id);
        stmt.bind(3, request.source_id);
        stmt.bind(4, request.version);
        if (request.file_path.empty()) stmt.bind_null(5); else stmt.bind(5, request.file_path);
        if (request.file_type.empty()) stmt.bind_null(6); else stmt.bind(6, request.file_type);
        if (request.file_size == 0) stmt.bind_null(7); else stmt.bind(7, request.file_size);
        stmt.bind(8, now);
        stmt.bind(9, now);
        stmt.step();

        Document doc;
        doc.id = sqlite3_last_insert_rowid(m_db);
        doc.tenant_id = request.tenant_id;
        doc.knowledge_source_id = knowledge_source_id;
        doc.source_id = request.source_id;
        doc.version = request.version;
        doc.file_path = request.file_path;
        doc.file_type = request.file_type;
        doc.file_size = request.file_size;
        doc.created_at = from_epoch(now);
        doc.last_updated_at = from_epoch(now);
        return doc;
    }

    std::vector<int64_t> MetadataStore::insert_chunks(const Document& document, const std::vector<std::string>& texts) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        std::vector<int64_t> ids;
        ids.reserve(texts.size());

        Statement stmt(m_db,
            "INSERT INTO document_chunks (tenant_id, document_id, chunk_index, chunk_text, source_id, version, "
            "last_updated_at, is_deprecated, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, 0, ?);");
        auto now = to_epoch(Clock::now());
        for (size_t i = 0; i < texts.size(); ++i) {
            stmt.reset();
            stmt.bind(1, document.tenant_id);
            stmt.bind(2, document.id);
            stmt.bind(3, static_cast<int>(i));
            stmt.bind(4, texts[i]);
            stmt.bind(5, document.source_id);
            stmt.bind(6, document.version);
            stmt.bind(7, now);
            stmt.bind(8, now);
            stmt.step();
            ids.push_back(sqlite3_last_insert_rowid(m_db));
        }
        return ids;
    }

    void MetadataStore::confirm_vectors(const std::vector<int64_t>& chunk_ids) {
        if (chunk_ids.empty()) return;
        Transaction tx(*this);
        Statement stmt(m_db, "UPDATE document_chunks SET vector_id = id WHERE id = ?;");
        for (auto id : chunk_ids) {
            stmt.reset();
            stmt.bind(1, id);
            stmt.step();
        }
        tx.commit();
    }

    std::vector<DocumentChunk> MetadataStore::query_chunks(const std::string& where, int64_t tenant_id, std::optional<int64_t> arg) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        std::string sql = std::string(kChunkColumns) + where + " ORDER BY id;";
        Statement stmt(m_db, sql.c_str());
        stmt.bind(1, tenant_id);
        if (arg) stmt.bind(2, *arg);

        std::vector<DocumentChunk> chunks;
        while (stmt.step()) {
            chunks.push_back(read_chunk(stmt));
        }
        return chunks;
    }

    std::optional<DocumentChunk> MetadataStore::get_chunk(int64_t tenant_id, int64_t chunk_id) {
        auto chunks = query_chunks("WHERE tenant_id = ? AND id = ?", tenant_id, chunk_id);
        if (chunks.empty()) return std::nullopt;
        return chunks.front();
    }

    std::vector<DocumentChunk> MetadataStore::chunks_for_document(int64_t tenant_id, int64_t document_id) {
        return query_chunks("WHERE tenant_id = ? AND document_id = ?", tenant_id, document_id);
    }

    std::vector<DocumentChunk> MetadataStore::unconfirmed_chunks(int64_t tenant_id, std::optional<int64_t> document_id) {
        if (document_id) {
            return query_chunks("WHERE tenant_id = ? AND vector_id IS NULL AND document_id = ?", tenant_id, document_id);
        }
        return query_chunks("WHERE tenant_id = ? AND vector_id IS NULL", tenant_id, std::nullopt);
    }

    std::vector<DocumentChunk> MetadataStore::confirmed_chunks(int64_t tenant_id) {
        return query_chunks("WHERE tenant_id = ? AND vector_id IS NOT NULL", tenant_id, std::nullopt);
    }

    size_t MetadataStore::set_deprecated(int64_t tenant_id, const std::string& source_id, std::optional<int> version, bool deprecated) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        const char* sql = version
            ? "UPDATE document_chunks SET is_deprecated = ? WHERE tenant_id = ? AND source_id = ? AND version = ?;"
            : "UPDATE document_chunks SET is_deprecated = ? WHERE tenant_id = ? AND source_id = ?;";
        Statement stmt(m_db, sql);
        stmt.bind(1, deprecated ? 1 : 0);
        stmt.bind(2, tenant_id);
        stmt.bind(3, source_id);
        if (version) stmt.bind(4, *version);
        stmt.step();
        return static_cast<size_t>(sqlite3_changes(m_db));
    }

    size_t MetadataStore::set_last_updated(int64_t tenant_id, int64_t document_id, TimePoint when) {
        Transaction tx(*this);
        auto epoch = to_epoch(when);

        Statement doc_stmt(m_db, "UPDATE documents SET last_updated_at = ?, updated_at = ? WHERE tenant_id = ? AND id = ?;");
        doc_stmt.bind(1, epoch);
        doc_stmt.bind(2, to_epoch(Clock::now()));
        doc_stmt.bind(3, tenant_id);
        doc_stmt.bind(4, document_id);
        doc_stmt.step();

        Statement chunk_stmt(m_db, "UPDATE document_chunks SET last_updated_at = ? WHERE tenant_id = ? AND document_id = ?;");
        chunk_stmt.bind(1, epoch);
        chunk_stmt.bind(2, tenant_id);
        chunk_stmt.bind(3, document_id);
        chunk_stmt.step();
        auto changed = static_cast<size_t>(sqlite3_changes(m_db));

        tx.commit();
        return changed;
    }

    size_t MetadataStore::count_documents(int64_t tenant_id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(m_db, "SELECT COUNT(*) FROM documents WHERE tenant_id = ?;");
        stmt.bind(1, tenant_id);
        return stmt.step() ? static_cast<size_t>(stmt.int64(0)) : 0;
    }

    size_t MetadataStore::count_chunks(int64_t tenant_id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(m_db, "SELECT COUNT(*) FROM document_chunks WHERE tenant_id = ?;");
        stmt.bind(1, tenant_id);
        return stmt.step() ? static_cast<size_t>(stmt.int64(0)) : 0;
    }

    std::vector<int64_t> MetadataStore::tenants() {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(m_db, "SELECT DISTINCT tenant_id FROM knowledge_sources ORDER BY tenant_id;");
        std::vector<int64_t> ids;
        while (stmt.step()) ids.push_back(stmt.int64(0));
        return ids;
    }

}
