#include "ingestor.hpp"
#include "chunker.hpp"
#include "tessera/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <random>
#include <unordered_set>

namespace tessera::engine {

    namespace {

        std::string generate_uuid() {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<uint64_t> dist;
            uint64_t hi = dist(rng);
            uint64_t lo = dist(rng);
            hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
            lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

            char buf[37];
            std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                          static_cast<unsigned>(hi >> 32),
                          static_cast<unsigned>((hi >> 16) & 0xFFFF),
                          static_cast<unsigned>(hi & 0xFFFF),
                          static_cast<unsigned>(lo >> 48),
                          static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
            return buf;
        }

        std::string lower_extension(const std::string& filename) {
            auto ext = std::filesystem::path(filename).extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        std::vector<int64_t> ids_of(const std::vector<DocumentChunk>& chunks) {
            std::vector<int64_t> ids;
            ids.reserve(chunks.size());
            for (const auto& c : chunks) ids.push_back(c.id);
            return ids;
        }

    }

    Ingestor::Ingestor(MetadataStore& store, Embedder& embedder, IndexRegistry& indices, ChunkingOptions options)
        : m_store(store), m_embedder(embedder), m_indices(indices), m_options(options) {
        Chunker::validate(m_options.max_tokens, m_options.overlap_tokens);
        if (m_embedder.dimension() != m_indices.dimension()) {
            throw ConfigurationError("embedder dimension " + std::to_string(m_embedder.dimension()) +
                                     " does not match index dimension " + std::to_string(m_indices.dimension()));
        }
    }

    std::vector<std::vector<float>> Ingestor::embed_all(const std::vector<std::string>& texts) {
        auto vectors = m_embedder.embed_batch(texts);
        if (vectors.size() != texts.size()) {
            throw ModelUnavailableError("embedder returned " + std::to_string(vectors.size()) +
                                        " vectors for " + std::to_string(texts.size()) + " texts");
        }
        return vectors;
    }

    size_t Ingestor::index_chunks(int64_t tenant_id, const std::vector<DocumentChunk>& chunks) {
        if (chunks.empty()) return 0;

        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& c : chunks) texts.push_back(c.chunk_text);

        auto vectors = embed_all(texts);
        auto ids = ids_of(chunks);
        m_indices.get(tenant_id)->add(vectors, ids);
        m_store.confirm_vectors(ids);
        return ids.size();
    }

    IngestResult Ingestor::resume(const Document& document) {
        IngestResult result;
        result.document_id = document.id;

        auto pending = m_store.unconfirmed_chunks(document.tenant_id, document.id);
        if (pending.empty()) {
            result.status = IngestResult::Status::AlreadyExists;
            result.chunk_count = m_store.chunks_for_document(document.tenant_id, document.id).size();
            result.message = "Document already exists";
            return result;
        }

        std::cout << "[Ingestor] Document " << document.id << " (" << document.source_id << " v" << document.version
                  << ") has " << pending.size() << " chunks without confirmed vectors; re-indexing\n";
        index_chunks(document.tenant_id, pending);

        result.status = IngestResult::Status::Repaired;
        result.chunk_count = m_store.chunks_for_document(document.tenant_id, document.id).size();
        result.message = "Knowledge ingested";
        return result;
    }

    IngestResult Ingestor::ingest(const IngestRequest& request) {
        if (request.source_id.empty()) {
            throw ConfigurationError("source_id must not be empty");
        }

        if (auto existing = m_store.find_document(request.tenant_id, request.source_id, request.version)) {
            return resume(*existing);
        }

        // Chunk and embed before opening the transaction so no database lock spans the model call.
        auto texts = Chunker::chunk(request.content, m_options.max_tokens, m_options.overlap_tokens);
        std::vector<std::vector<float>> vectors;
        if (!texts.empty()) {
            vectors = embed_all(texts);
        }

        Document document;
        std::vector<int64_t> ids;
        std::optional<Document> raced;
        {
            MetadataStore::Transaction tx(m_store);
            auto source = m_store.find_or_create_source(request.tenant_id, request.source_type,
                                                        request.source_id, request.name);
            raced = m_store.find_document(request.tenant_id, request.source_id, request.version);
            if (!raced) {
                document = m_store.create_document(request, source.id);
                ids = m_store.insert_chunks(document, texts);
                tx.commit();
            }
        }
        if (raced) {
            // Another worker committed this version between the first check and the transaction.
            return resume(*raced);
        }

        IngestResult result;
        result.document_id = document.id;

        if (ids.empty()) {
            std::cout << "[Ingestor] Tenant " << request.tenant_id << ": " << request.source_id
                      << " v" << request.version << " has no content\n";
            result.status = IngestResult::Status::Empty;
            result.message = "No content to ingest";
            return result;
        }

        try {
            m_indices.get(request.tenant_id)->add(vectors, ids);
        } catch (const Error& e) {
            std::cerr << "[Ingestor] Indexing failed for document " << document.id << ": " << e.what()
                      << " (rows kept; retry or reconcile will finish indexing)\n";
            throw;
        }
        m_store.confirm_vectors(ids);

        std::cout << "[Ingestor] Tenant " << request.tenant_id << ": indexed " << ids.size() << " chunks for "
                  << request.source_id << " v" << request.version << " (document " << document.id << ")\n";

        result.status = IngestResult::Status::Created;
        result.chunk_count = ids.size();
        result.message = "Knowledge ingested";
        return result;
    }

    IngestResult Ingestor::ingest_file(int64_t tenant_id, const std::string& file_bytes,
                                       const std::string& filename, TextExtractor& extractor) {
        return ingest(prepare_upload(tenant_id, file_bytes, filename, extractor));
    }

    IngestRequest Ingestor::prepare_upload(int64_t tenant_id, const std::string& file_bytes,
                                           const std::string& filename, TextExtractor& extractor) {
        if (filename.empty()) {
            throw ExtractionError("No file provided");
        }
        auto ext = lower_extension(filename);
        if (!is_allowed_upload_extension(ext)) {
            throw ExtractionError("File type " + ext + " not allowed");
        }

        IngestRequest request;
        request.tenant_id = tenant_id;
        request.source_type = SourceType::ManualUpload;
        request.source_id = generate_uuid();
        request.version = 1;
        request.name = std::filesystem::path(filename).filename().string();
        request.content = extractor.extract_text(file_bytes, ext);
        request.file_type = ext;
        request.file_size = static_cast<int64_t>(file_bytes.size());
        return request;
    }

    ConsistencyReport Ingestor::reconcile(int64_t tenant_id) {
        ConsistencyReport report;
        report.tenant_id = tenant_id;

        auto index = m_indices.get(tenant_id);

        // Snapshot the index before reading rows: rows are committed before their vectors are
        // added, so every id in this snapshot already has a visible row unless it is a true orphan.
        auto indexed = index->ids();
        auto unconfirmed = m_store.unconfirmed_chunks(tenant_id);
        auto confirmed = m_store.confirmed_chunks(tenant_id);

        std::unordered_set<int64_t> indexed_set(indexed.begin(), indexed.end());
        std::unordered_set<int64_t> known;

        std::vector<DocumentChunk> to_index;
        for (const auto& c : unconfirmed) {
            known.insert(c.id);
            report.unconfirmed_chunks.push_back(c.id);
            to_index.push_back(c);
        }
        for (const auto& c : confirmed) {
            known.insert(c.id);
            if (!indexed_set.count(c.id)) {
                report.missing_vectors.push_back(c.id);
                to_index.push_back(c);
            }
        }
        for (auto id : indexed) {
            if (!known.count(id)) report.orphan_vectors.push_back(id);
        }

        if (report.consistent()) {
            std::cout << "[Ingestor] Tenant " << tenant_id << " is consistent (" << indexed.size() << " vectors)\n";
            return report;
        }

        std::cerr << "[Ingestor] Tenant " << tenant_id << " consistency violations: "
                  << report.unconfirmed_chunks.size() << " unconfirmed, "
                  << report.missing_vectors.size() << " missing vectors, "
                  << report.orphan_vectors.size() << " orphan vectors\n";

        report.reindexed = index_chunks(tenant_id, to_index);
        if (!report.orphan_vectors.empty()) {
            report.orphans_removed = index->remove(report.orphan_vectors);
        }
        return report;
    }

}
