#pragma once

#include <string>
#include <vector>
#include "tessera/types.hpp"
#include "metadata_store.hpp"
#include "embedder.hpp"
#include "index_registry.hpp"
#include "extractor.hpp"

namespace tessera::engine {

    struct ChunkingOptions {
        size_t max_tokens = 500;
        size_t overlap_tokens = 250;
    };

    /**
     * @brief Adds document versions to the metadata store and the tenant index.
     *
     * Ordering contract: chunk rows are committed before their vectors are
     * added, and confirmed (vector_id set) only after the index file is
     * written. A crash can therefore leave rows without vectors, never
     * vectors without rows. Re-running ingest() for the same version, or
     * reconcile() for the tenant, finishes the indexing.
     */
    class Ingestor {
    public:
        /**
         * @throws ConfigurationError if the chunking options are invalid.
         */
        Ingestor(MetadataStore& store, Embedder& embedder, IndexRegistry& indices, ChunkingOptions options = {});

        /**
         * @brief Ingests one version of a source's content. Safe to repeat.
         * @throws ModelUnavailableError, IndexWriteError (retryable) or StoreError.
         */
        IngestResult ingest(const IngestRequest& request);

        /**
         * @brief Upload entry point: extracts text and ingests it as a new manual_upload source.
         * @throws ExtractionError for disallowed extensions or unreadable content.
         */
        IngestResult ingest_file(int64_t tenant_id, const std::string& file_bytes,
                                 const std::string& filename, TextExtractor& extractor);

        /**
         * @brief Checks and extracts an upload into the request ingest_file() would run.
         *
         * Lets callers extract synchronously and defer the ingestion to the job queue.
         * @throws ExtractionError for disallowed extensions or unreadable content.
         */
        static IngestRequest prepare_upload(int64_t tenant_id, const std::string& file_bytes,
                                            const std::string& filename, TextExtractor& extractor);

        /**
         * @brief Finds and repairs divergence between chunk rows and the tenant index.
         *
         * Unconfirmed rows and confirmed rows missing from the index are
         * re-embedded and re-added; index entries without a row are dropped
         * from the index. Metadata is never deleted.
         */
        ConsistencyReport reconcile(int64_t tenant_id);

        const ChunkingOptions& options() const { return m_options; }

    private:
        MetadataStore& m_store;
        Embedder& m_embedder;
        IndexRegistry& m_indices;
        ChunkingOptions m_options;

        IngestResult resume(const Document& document);
        size_t index_chunks(int64_t tenant_id, const std::vector<DocumentChunk>& chunks);
        std::vector<std::vector<float>> embed_all(const std::vector<std::string>& texts);
    };

}
