#pragma once

#include <string>
#include <functional>
#include <nlohmann/json.hpp>
#include "tessera/types.hpp"
#include "metadata_store.hpp"
#include "index_registry.hpp"
#include "ingestor.hpp"
#include "query_service.hpp"
#include "extractor.hpp"
#include "job_queue.hpp"

namespace tessera::engine {

    /**
     * @brief Dispatches one IPC request {"method": ..., "params": {...}}.
     *
     * Replies are {"result": ...} or {"error": {"type", "message", "retryable"}}.
     * handle() never throws.
     */
    class RequestHandler {
    public:
        struct Services {
            MetadataStore& store;
            IndexRegistry& indices;
            Ingestor& ingestor;
            QueryService& queries;
            TextExtractor& extractor;
            JobQueue& queue;
        };

        RequestHandler(Services services, RetrieveOptions defaults, std::function<void()> on_shutdown);

        std::string handle(const std::string& request);

        nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);

    private:
        Services m_services;
        RetrieveOptions m_defaults;
        std::function<void()> m_on_shutdown;

        nlohmann::json status(const nlohmann::json& params);
        nlohmann::json ingest(const nlohmann::json& params);
        nlohmann::json upload(const nlohmann::json& params);
        nlohmann::json query(const nlohmann::json& params);
        nlohmann::json deprecate(const nlohmann::json& params);
        nlohmann::json reconcile(const nlohmann::json& params);
        nlohmann::json task_status(const nlohmann::json& params);
    };

    nlohmann::json to_json(const IngestResult& result);
    nlohmann::json to_json(const QueryResponse& response);
    nlohmann::json to_json(const ConsistencyReport& report);
    nlohmann::json to_json(uint64_t task_id, const JobStatus& status);

    IngestRequest ingest_request_from_json(const nlohmann::json& params);

}
