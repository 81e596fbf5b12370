#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

namespace tessera::engine {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    enum class SourceType {
        Api,
        ManualUpload,
        DirectoryIngestion
    };

    std::string to_string(SourceType type);
    std::optional<SourceType> parse_source_type(const std::string& value);

    struct KnowledgeSource {
        int64_t id = 0;
        int64_t tenant_id = 0;
        SourceType source_type = SourceType::Api;
        std::string source_id;
        std::string name;
        TimePoint created_at;
        std::optional<TimePoint> updated_at;
    };

    struct Document {
        int64_t id = 0;
        int64_t tenant_id = 0;
        int64_t knowledge_source_id = 0;
        std::string source_id;
        int version = 1;
        std::string file_path;
        std::string file_type;
        int64_t file_size = 0;
        TimePoint created_at;
        std::optional<TimePoint> updated_at;
        std::optional<TimePoint> last_updated_at;
    };

    struct DocumentChunk {
        int64_t id = 0;
        int64_t tenant_id = 0;
        int64_t document_id = 0;
        int chunk_index = 0;
        std::string chunk_text;
        std::string source_id;
        int version = 1;
        std::optional<int64_t> vector_id; // set once the vector is confirmed in the tenant index
        bool is_deprecated = false;
        std::optional<TimePoint> last_updated_at;
        TimePoint created_at;
    };

    struct IngestRequest {
        int64_t tenant_id = 0;
        SourceType source_type = SourceType::Api;
        std::string source_id;
        int version = 1;
        std::string name;
        std::string content;

        // Upload metadata, empty for API ingestion
        std::string file_path;
        std::string file_type;
        int64_t file_size = 0;
    };

    struct IngestResult {
        enum class Status {
            Created,
            AlreadyExists,
            Repaired,
            Empty
        };

        int64_t document_id = 0;
        size_t chunk_count = 0;
        Status status = Status::Created;
        std::string message;
    };

    std::string to_string(IngestResult::Status status);

    struct SearchHit {
        float distance = 0.0f;
        int64_t id = -1; // -1 means "no match"
    };

    struct ScoredChunk {
        int64_t chunk_id = 0;
        double similarity = 0.0;
        double freshness = 1.0;
        double final_score = 0.0;
        DocumentChunk chunk;
    };

    struct RetrieveOptions {
        int top_k = 5;
        double freshness_weight = 0.1;
        bool exclude_deprecated = true;
    };

    struct QuerySource {
        std::string source_id;
        int version = 1;
        double similarity_score = 0.0;
        std::optional<TimePoint> last_updated_at;
    };

    struct QueryResponse {
        std::string answer;
        std::vector<QuerySource> sources;
        size_t retrieved_chunks = 0;
    };

    struct ConsistencyReport {
        int64_t tenant_id = 0;
        std::vector<int64_t> unconfirmed_chunks;   // chunk rows without a vector id
        std::vector<int64_t> missing_vectors;      // confirmed rows absent from the index
        std::vector<int64_t> orphan_vectors;       // index entries without a chunk row
        size_t reindexed = 0;
        size_t orphans_removed = 0;

        bool consistent() const {
            return unconfirmed_chunks.empty() && missing_vectors.empty() && orphan_vectors.empty();
        }
    };

}
