#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "tessera/errors.hpp"
#include "retriever.hpp"

namespace tessera::engine {

    struct Config {
        std::filesystem::path data_dir; // empty: platform data directory

        size_t chunk_size = 500;
        size_t chunk_overlap = 250;

        std::string embedding_backend = "ollama"; // ollama, onnx, openai
        std::string embedding_model = "all-minilm";
        std::string embedding_endpoint = "http://localhost:11434/api/embeddings"; // for ollama
        size_t embedding_dimension = 384;
        long embedding_timeout_ms = 30000;
        std::string onnx_model_path = "model.onnx";
        std::string onnx_vocab_path = "vocab.txt";
        std::string openai_key = "";
        std::string openai_model = "text-embedding-3-small";

        std::string llm_model = "llama3";
        std::string llm_endpoint = "http://localhost:11434/api/generate";
        long llm_timeout_ms = 120000;

        int default_top_k = 5;
        double default_freshness_weight = 0.1;
        FreshnessPolicy freshness_policy = FreshnessPolicy::BoostOlder;

        int ingest_max_attempts = 3;
        std::string socket_name = "tessera.sock";

        std::filesystem::path database_path() const { return data_dir / "tessera.db"; }
        std::filesystem::path index_dir() const { return data_dir / "indices"; }

        /**
         * @throws ConfigurationError for an unknown freshness_policy or a negative count.
         */
        static Config from_json(const nlohmann::json& j) {
            Config cfg;
            // Read as signed so a negative value is caught instead of wrapping to a huge size_t
            auto count = [&j](const char* key) -> size_t {
                auto value = j[key].get<int64_t>();
                if (value < 0) throw ConfigurationError(std::string(key) + " must not be negative");
                return static_cast<size_t>(value);
            };
            if (j.contains("data_dir")) cfg.data_dir = j["data_dir"].get<std::string>();
            if (j.contains("chunk_size")) cfg.chunk_size = count("chunk_size");
            if (j.contains("chunk_overlap")) cfg.chunk_overlap = count("chunk_overlap");
            if (j.contains("embedding_backend")) cfg.embedding_backend = j["embedding_backend"];
            if (j.contains("embedding_model")) cfg.embedding_model = j["embedding_model"];
            if (j.contains("embedding_endpoint")) cfg.embedding_endpoint = j["embedding_endpoint"];
            if (j.contains("embedding_dimension")) cfg.embedding_dimension = count("embedding_dimension");
            if (j.contains("embedding_timeout_ms")) cfg.embedding_timeout_ms = j["embedding_timeout_ms"].get<long>();
            if (j.contains("onnx_model_path")) cfg.onnx_model_path = j["onnx_model_path"];
            if (j.contains("onnx_vocab_path")) cfg.onnx_vocab_path = j["onnx_vocab_path"];
            if (j.contains("openai_key")) cfg.openai_key = j["openai_key"];
            if (j.contains("openai_model")) cfg.openai_model = j["openai_model"];
            if (j.contains("llm_model")) cfg.llm_model = j["llm_model"];
            if (j.contains("llm_endpoint")) cfg.llm_endpoint = j["llm_endpoint"];
            if (j.contains("llm_timeout_ms")) cfg.llm_timeout_ms = j["llm_timeout_ms"].get<long>();
            if (j.contains("default_top_k")) cfg.default_top_k = j["default_top_k"].get<int>();
            if (j.contains("default_freshness_weight")) cfg.default_freshness_weight = j["default_freshness_weight"];
            if (j.contains("freshness_policy")) {
                std::string policy = j["freshness_policy"];
                auto parsed = parse_freshness_policy(policy);
                if (!parsed) throw ConfigurationError("unknown freshness_policy: " + policy);
                cfg.freshness_policy = *parsed;
            }
            if (j.contains("ingest_max_attempts")) cfg.ingest_max_attempts = j["ingest_max_attempts"].get<int>();
            if (j.contains("socket_name")) cfg.socket_name = j["socket_name"];
            return cfg;
        }

        /**
         * @brief Reads the config file; a missing file gives defaults, a malformed one is logged and ignored.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                cfg = from_json(nlohmann::json::parse(f));
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[Config] Ignoring malformed " << path << ": " << e.what() << "\n";
                return Config{};
            }
            return cfg;
        }

        /**
         * @throws ConfigurationError naming the first invalid value.
         */
        void validate() const {
            if (chunk_size == 0) throw ConfigurationError("chunk_size must be positive");
            if (chunk_overlap >= chunk_size) throw ConfigurationError("chunk_overlap must be smaller than chunk_size");
            if (embedding_dimension == 0) throw ConfigurationError("embedding_dimension must be positive");
            if (embedding_backend != "ollama" && embedding_backend != "onnx" && embedding_backend != "openai") {
                throw ConfigurationError("unknown embedding_backend: " + embedding_backend);
            }
            if (default_top_k <= 0) throw ConfigurationError("default_top_k must be positive");
            if (ingest_max_attempts <= 0) throw ConfigurationError("ingest_max_attempts must be positive");
            if (embedding_timeout_ms <= 0 || llm_timeout_ms <= 0) throw ConfigurationError("timeouts must be positive");
            if (default_freshness_weight < 0.0) throw ConfigurationError("default_freshness_weight must not be negative");
        }

        nlohmann::json to_json() const {
            nlohmann::json j;
            j["data_dir"] = data_dir.string();
            j["chunk_size"] = chunk_size;
            j["chunk_overlap"] = chunk_overlap;
            j["embedding_backend"] = embedding_backend;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            j["embedding_dimension"] = embedding_dimension;
            j["embedding_timeout_ms"] = embedding_timeout_ms;
            j["llm_model"] = llm_model;
            j["llm_endpoint"] = llm_endpoint;
            j["llm_timeout_ms"] = llm_timeout_ms;
            j["default_top_k"] = default_top_k;
            j["default_freshness_weight"] = default_freshness_weight;
            j["freshness_policy"] = to_string(freshness_policy);
            j["ingest_max_attempts"] = ingest_max_attempts;
            j["socket_name"] = socket_name;
            if (!openai_key.empty()) j["openai_key"] = openai_key;
            return j;
        }

        void save(const std::filesystem::path& path) const {
            std::ofstream f(path);
            f << to_json().dump(4);
        }
    };

}
