#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <filesystem>
#include <sqlite3.h>
#include "tessera/types.hpp"

namespace tessera::engine {

    /**
     * @brief SQLite store for knowledge sources, documents and chunks.
     *
     * Source of truth for chunk text, version, deprecation and timestamps.
     * All statements share one connection guarded by a recursive mutex; a
     * Transaction holds that mutex until it commits or rolls back, so its
     * rows never interleave with another thread's writes.
     *
     * Lookups return std::nullopt when nothing matches; SQL failures throw
     * StoreError.
     */
    class MetadataStore {
    public:
        MetadataStore();
        ~MetadataStore();

        MetadataStore(const MetadataStore&) = delete;
        MetadataStore& operator=(const MetadataStore&) = delete;

        /**
         * @brief Opens (or creates) the database and its schema. ":memory:" is accepted.
         */
        bool open(const std::filesystem::path& path);
        void close();
        bool is_open() const;

        /**
         * @brief Initializes the schema if it doesn't exist.
         */
        bool initialize_schema();

        class Transaction {
        public:
            explicit Transaction(MetadataStore& store);
            ~Transaction();

            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;

            void commit();

        private:
            MetadataStore& m_store;
            std::unique_lock<std::recursive_mutex> m_lock;
            bool m_done = false;
        };

        /**
         * @brief Lookup-or-insert of the (tenant, source_id) knowledge source.
         */
        KnowledgeSource find_or_create_source(int64_t tenant_id, SourceType type,
                                              const std::string& source_id, const std::string& name);
        std::optional<KnowledgeSource> find_source(int64_t tenant_id, const std::string& source_id);

        std::optional<Document> find_document(int64_t tenant_id, const std::string& source_id, int version);
        Document create_document(const IngestRequest& request, int64_t knowledge_source_id);

        /**
         * @brief Inserts one row per text with chunk_index = position. Returns the new primary keys.
         */
        std::vector<int64_t> insert_chunks(const Document& document, const std::vector<std::string>& texts);

        /**
         * @brief Records that each chunk's vector is in the tenant index (vector_id = id).
         */
        void confirm_vectors(const std::vector<int64_t>& chunk_ids);

        std::optional<DocumentChunk> get_chunk(int64_t tenant_id, int64_t chunk_id);
        std::vector<DocumentChunk> chunks_for_document(int64_t tenant_id, int64_t document_id);

        /**
         * @brief Chunks still waiting for index confirmation, optionally for one document.
         */
        std::vector<DocumentChunk> unconfirmed_chunks(int64_t tenant_id, std::optional<int64_t> document_id = std::nullopt);
        std::vector<DocumentChunk> confirmed_chunks(int64_t tenant_id);

        /**
         * @brief External write: flags every chunk of a source (or one version of it).
         * @return Number of chunks changed.
         */
        size_t set_deprecated(int64_t tenant_id, const std::string& source_id, std::optional<int> version, bool deprecated);

        /**
         * @brief External write: stamps last_updated_at on a document and its chunks.
         */
        size_t set_last_updated(int64_t tenant_id, int64_t document_id, TimePoint when);

        size_t count_documents(int64_t tenant_id);
        size_t count_chunks(int64_t tenant_id);
        std::vector<int64_t> tenants();

    private:
        sqlite3* m_db = nullptr;
        mutable std::recursive_mutex m_mutex;

        void exec(const char* sql);
        std::vector<DocumentChunk> query_chunks(const std::string& where, int64_t tenant_id, std::optional<int64_t> arg);
    };

}
