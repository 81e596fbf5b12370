#include "request_handler.hpp"
#include "tessera/errors.hpp"
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>

using json = nlohmann::json;

namespace tessera::engine {

    namespace {

        class RequestError : public Error {
        public:
            using Error::Error;
            const char* type() const override { return "RequestError"; }
        };

        json error_reply(const char* type, const std::string& message, bool retryable) {
            return {{"error", {{"type", type}, {"message", message}, {"retryable", retryable}}}};
        }

        json format_timestamp(const std::optional<TimePoint>& tp) {
            if (!tp) return nullptr;
            std::time_t t = Clock::to_time_t(*tp);
            std::tm tm{};
            gmtime_r(&t, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
            return std::string(buf);
        }

        int64_t require_tenant(const json& params) {
            if (!params.contains("tenant_id")) throw RequestError("missing tenant_id");
            return params["tenant_id"].get<int64_t>();
        }

        std::string require_string(const json& params, const char* key) {
            if (!params.contains(key)) throw RequestError(std::string("missing ") + key);
            return params[key].get<std::string>();
        }

        json queued_reply(uint64_t task_id, const JobQueue& queue) {
            return {{"task_id", task_id}, {"status", to_string(JobState::Pending)}, {"queue_size", queue.size()}};
        }

    }

    json to_json(const IngestResult& result) {
        return {
            {"document_id", result.document_id},
            {"chunk_count", result.chunk_count},
            {"status", to_string(result.status)},
            {"message", result.message}
        };
    }

    json to_json(const QueryResponse& response) {
        json sources = json::array();
        for (const auto& s : response.sources) {
            sources.push_back({
                {"source_id", s.source_id},
                {"version", s.version},
                {"similarity_score", s.similarity_score},
                {"last_updated_at", format_timestamp(s.last_updated_at)}
            });
        }
        return {
            {"answer", response.answer},
            {"sources", sources},
            {"retrieved_chunks", response.retrieved_chunks}
        };
    }

    json to_json(const ConsistencyReport& report) {
        return {
            {"tenant_id", report.tenant_id},
            {"consistent", report.consistent()},
            {"unconfirmed_chunks", report.unconfirmed_chunks},
            {"missing_vectors", report.missing_vectors},
            {"orphan_vectors", report.orphan_vectors},
            {"reindexed", report.reindexed},
            {"orphans_removed", report.orphans_removed}
        };
    }

    json to_json(uint64_t task_id, const JobStatus& status) {
        json j = {
            {"task_id", task_id},
            {"status", to_string(status.state)},
            {"attempts", status.attempts}
        };
        if (status.result) j["result"] = to_json(*status.result);
        if (status.state == JobState::Failed) {
            j["error"] = {{"type", status.error_type}, {"message", status.error}};
        }
        return j;
    }

    IngestRequest ingest_request_from_json(const json& params) {
        IngestRequest request;
        request.tenant_id = require_tenant(params);
        request.source_id = require_string(params, "source_id");
        request.content = params.value("content", "");
        request.version = params.value("version", 1);
        request.name = params.value("name", request.source_id);

        std::string type = params.value("source_type", "api");
        auto parsed = parse_source_type(type);
        if (!parsed) throw RequestError("unknown source_type: " + type);
        request.source_type = *parsed;
        return request;
    }

    RequestHandler::RequestHandler(Services services, RetrieveOptions defaults, std::function<void()> on_shutdown)
        : m_services(services), m_defaults(defaults), m_on_shutdown(std::move(on_shutdown)) {}

    std::string RequestHandler::handle(const std::string& request) {
        json reply;
        try {
            auto j = json::parse(request);
            std::string method = j.value("method", "");
            json params = j.value("params", json::object());
            reply = {{"result", dispatch(method, params)}};
        } catch (const Error& e) {
            reply = error_reply(e.type(), e.what(), e.retryable());
        } catch (const json::exception& e) {
            reply = error_reply("RequestError", e.what(), false);
        } catch (const std::exception& e) {
            std::cerr << "[RequestHandler] Unexpected failure: " << e.what() << "\n";
            reply = error_reply("InternalError", e.what(), false);
        }
        // Messages can echo raw request bytes, which need not be valid UTF-8
        return reply.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json RequestHandler::dispatch(const std::string& method, const json& params) {
        if (method == "ping") return "pong";
        if (method == "status") return status(params);
        if (method == "ingest") return ingest(params);
        if (method == "upload") return upload(params);
        if (method == "query") return query(params);
        if (method == "deprecate") return deprecate(params);
        if (method == "reconcile") return reconcile(params);
        if (method == "task_status") return task_status(params);
        if (method == "shutdown") {
            if (m_on_shutdown) m_on_shutdown();
            return "shutting down";
        }
        throw RequestError("unknown method: " + method);
    }

    json RequestHandler::status(const json& params) {
        json res;
        res["queue_size"] = m_services.queue.size();
        res["loaded_indices"] = m_services.indices.loaded_count();

        json tenants = json::array();
        for (auto tenant : m_services.store.tenants()) {
            if (params.contains("tenant_id") && params["tenant_id"].get<int64_t>() != tenant) continue;
            tenants.push_back({
                {"tenant_id", tenant},
                {"documents", m_services.store.count_documents(tenant)},
                {"chunks", m_services.store.count_chunks(tenant)},
                {"vectors", m_services.indices.get(tenant)->size()}
            });
        }
        res["tenants"] = tenants;
        return res;
    }

    json RequestHandler::ingest(const json& params) {
        auto request = ingest_request_from_json(params);
        if (params.value("async", false)) {
            return queued_reply(m_services.queue.submit(std::move(request)), m_services.queue);
        }
        return to_json(m_services.ingestor.ingest(request));
    }

    json RequestHandler::upload(const json& params) {
        int64_t tenant = require_tenant(params);
        std::filesystem::path path = require_string(params, "path");

        std::ifstream file(path, std::ios::binary);
        if (!file) throw ExtractionError("cannot read " + path.string());
        std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        // Extraction runs now either way, so a bad file is reported to the caller and not to the queue.
        auto request = Ingestor::prepare_upload(tenant, bytes, path.filename().string(), m_services.extractor);
        if (params.value("async", false)) {
            return queued_reply(m_services.queue.submit(std::move(request)), m_services.queue);
        }
        return to_json(m_services.ingestor.ingest(request));
    }

    json RequestHandler::query(const json& params) {
        int64_t tenant = require_tenant(params);
        std::string q = require_string(params, "query");

        RetrieveOptions options = m_defaults;
        options.top_k = params.value("top_k", options.top_k);
        options.freshness_weight = params.value("freshness_weight", options.freshness_weight);
        options.exclude_deprecated = params.value("exclude_deprecated", options.exclude_deprecated);

        return to_json(m_services.queries.answer(tenant, q, options));
    }

    json RequestHandler::deprecate(const json& params) {
        int64_t tenant = require_tenant(params);
        std::string source_id = require_string(params, "source_id");
        std::optional<int> version;
        if (params.contains("version")) version = params["version"].get<int>();
        bool deprecated = params.value("deprecated", true);

        auto updated = m_services.store.set_deprecated(tenant, source_id, version, deprecated);
        return {{"updated_chunks", updated}};
    }

    json RequestHandler::reconcile(const json& params) {
        json reports = json::array();
        if (params.contains("tenant_id")) {
            reports.push_back(to_json(m_services.ingestor.reconcile(params["tenant_id"].get<int64_t>())));
            return reports;
        }
        for (auto tenant : m_services.store.tenants()) {
            reports.push_back(to_json(m_services.ingestor.reconcile(tenant)));
        }
        return reports;
    }

    json RequestHandler::task_status(const json& params) {
        if (!params.contains("task_id")) throw RequestError("missing task_id");
        auto id = params["task_id"].get<uint64_t>();
        auto status = m_services.queue.status(id);
        if (!status) throw RequestError("unknown task_id: " + std::to_string(id));
        return to_json(id, *status);
    }

}
