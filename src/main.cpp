#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <cstdlib>

#include "platform.hpp"
#include "tessera/errors.hpp"
#include "engine/config.hpp"
#include "engine/http.hpp"
#include "engine/metadata_store.hpp"
#include "engine/embedder.hpp"
#include "engine/generator.hpp"
#include "engine/index_registry.hpp"
#include "engine/ingestor.hpp"
#include "engine/retriever.hpp"
#include "engine/answer_composer.hpp"
#include "engine/query_service.hpp"
#include "engine/extractor.hpp"
#include "engine/job_queue.hpp"
#include "engine/ingest_worker.hpp"
#include "engine/request_handler.hpp"

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    std::cout << "\n[Tessera] Interrupt signal (" << signum << ") received. Shutting down...\n";
    g_running = false;
}

namespace {

    std::unique_ptr<tessera::engine::Embedder> make_embedder(const tessera::engine::Config& config) {
        if (config.embedding_backend == "openai") {
            std::cout << "[Tessera] Using OpenAI Embedder (" << config.openai_model << ").\n";
            return tessera::engine::create_openai_embedder(config.openai_key, config.openai_model,
                                                           config.embedding_dimension, config.embedding_timeout_ms);
        }
        if (config.embedding_backend == "onnx") {
            std::cout << "[Tessera] Using Local ONNX Embedder.\n";
            return tessera::engine::create_onnx_embedder(config.onnx_model_path, config.onnx_vocab_path);
        }
        std::cout << "[Tessera] Using Ollama Embedder (" << config.embedding_model << ").\n";
        return tessera::engine::create_ollama_embedder(config.embedding_model, config.embedding_endpoint,
                                                       config.embedding_dimension, config.embedding_timeout_ms);
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[Tessera] Starting daemon (v0.1.0)...\n";

    // Setup Config Directory
    auto config_dir = tessera::platform::system::get_config_dir();
    if (!config_dir.empty()) {
        std::filesystem::create_directories(config_dir);
    }
    auto config_path = argc > 1 ? std::filesystem::path(argv[1]) : config_dir / "config.json";
    std::cout << "[Tessera] Config path: " << config_path << "\n";

    tessera::engine::Config config;
    try {
        config = tessera::engine::Config::load(config_path);
        const char* env_openai_key = std::getenv("OPENAI_API_KEY");
        if (env_openai_key) config.openai_key = env_openai_key;
        config.validate();
    } catch (const tessera::ConfigurationError& e) {
        std::cerr << "[Tessera] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    // Setup Data Directory
    if (config.data_dir.empty()) {
        config.data_dir = tessera::platform::system::get_data_dir();
        if (config.data_dir.empty()) config.data_dir = std::filesystem::current_path(); // Fallback
    }
    std::filesystem::create_directories(config.index_dir());
    std::cout << "[Tessera] Database path: " << config.database_path() << "\n";

    tessera::engine::MetadataStore store;
    if (!store.open(config.database_path())) {
        std::cerr << "[Tessera] Failed to open database.\n";
        return 1;
    }

    tessera::engine::http_global_init();

    std::unique_ptr<tessera::engine::Embedder> embedder;
    try {
        embedder = make_embedder(config);
    } catch (const tessera::Error& e) {
        std::cerr << "[Tessera] Embedder unavailable: " << e.what() << "\n";
        tessera::engine::http_global_cleanup();
        return 1;
    }
    auto generator = tessera::engine::create_ollama_generator(config.llm_model, config.llm_endpoint,
                                                              config.llm_timeout_ms);

    tessera::engine::IndexRegistry indices(config.index_dir(), embedder->dimension());

    tessera::engine::ScoringPolicy scoring;
    scoring.freshness = config.freshness_policy;

    std::unique_ptr<tessera::engine::Ingestor> ingestor;
    try {
        ingestor = std::make_unique<tessera::engine::Ingestor>(
            store, *embedder, indices,
            tessera::engine::ChunkingOptions{config.chunk_size, config.chunk_overlap});
    } catch (const tessera::ConfigurationError& e) {
        std::cerr << "[Tessera] Invalid configuration: " << e.what() << "\n";
        tessera::engine::http_global_cleanup();
        return 1;
    }
    tessera::engine::Retriever retriever(store, *embedder, indices, scoring);
    tessera::engine::AnswerComposer composer(*generator);
    tessera::engine::QueryService queries(retriever, composer);
    auto extractor = tessera::engine::create_document_extractor();
    if (!tessera::engine::pdf_extraction_available()) {
        std::cout << "[Tessera] Built without Poppler; PDF uploads will be rejected.\n";
    }

    // Finish any indexing interrupted by a previous crash
    for (auto tenant : store.tenants()) {
        try {
            ingestor->reconcile(tenant);
        } catch (const tessera::Error& e) {
            std::cerr << "[Tessera] Reconcile of tenant " << tenant << " deferred: " << e.what() << "\n";
        }
    }

    // Worker Logic: at-least-once delivery, retryable failures are re-queued
    tessera::engine::JobQueue queue;
    tessera::engine::IngestWorker worker(*ingestor, queue, config.ingest_max_attempts);
    std::thread worker_thread([&worker]() { worker.run(); });

    // Setup IPC
    auto bridge = tessera::platform::Bridge::create();

    tessera::engine::RequestHandler handler(
        {store, indices, *ingestor, queries, *extractor, queue},
        tessera::engine::RetrieveOptions{config.default_top_k, config.default_freshness_weight, true},
        [] { g_running = false; });
    bridge->set_handler([&handler](const std::string& request) { return handler.handle(request); });

    if (!bridge->listen(config.socket_name)) {
        g_running = false;
    } else {
        std::cout << "[Tessera] Ready.\n";
    }

    std::thread bridge_thread([&bridge]() { bridge->run(); });

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Shutdown
    queue.stop();
    bridge->stop();
    if (worker_thread.joinable()) worker_thread.join();
    if (bridge_thread.joinable()) bridge_thread.join();

    store.close();
    tessera::engine::http_global_cleanup();
    return 0;
}
