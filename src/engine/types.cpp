#include "tessera/types.hpp"

namespace tessera::engine {

    std::string to_string(SourceType type) {
        switch (type) {
            case SourceType::Api: return "api";
            case SourceType::ManualUpload: return "manual_upload";
            case SourceType::DirectoryIngestion: return "directory_ingestion";
        }
        return "api";
    }

    std::optional<SourceType> parse_source_type(const std::string& value) {
        if (value == "api") return SourceType::Api;
        if (value == "manual_upload") return SourceType::ManualUpload;
        if (value == "directory_ingestion") return SourceType::DirectoryIngestion;
        return std::nullopt;
    }

    std::string to_string(IngestResult::Status status) {
        switch (status) {
            case IngestResult::Status::Created: return "created";
            case IngestResult::Status::AlreadyExists: return "already_exists";
            case IngestResult::Status::Repaired: return "repaired";
            case IngestResult::Status::Empty: return "empty";
        }
        return "created";
    }

}
