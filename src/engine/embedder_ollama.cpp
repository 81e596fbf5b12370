#include "embedder.hpp"
#include "http.hpp"
#include "tessera/errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace tessera::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, size_t dimension, long timeout_ms)
            : m_model(model), m_endpoint(endpoint), m_dimension(dimension), m_timeout_ms(timeout_ms) {
            std::cout << "[OllamaEmbedder] Model " << m_model << " at " << m_endpoint << " (dim " << m_dimension << ")\n";
        }

        std::vector<float> embed(const std::string& text) override {
            std::string json_str;
            try {
                json body = {
                    {"model", m_model},
                    {"prompt", text}
                };
                json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            } catch (const json::exception& e) {
                throw ModelUnavailableError(std::string("Ollama request serialization failed: ") + e.what());
            }

            auto response = http_post_json(m_endpoint, json_str, m_timeout_ms);
            if (!response.error.empty()) {
                std::cerr << "[OllamaEmbedder] Request failed: " << response.error << "\n";
                throw ModelUnavailableError("Ollama embedding request failed: " + response.error, response.timed_out);
            }
            if (!response.ok()) {
                throw ModelUnavailableError("Ollama embedding request returned HTTP " + std::to_string(response.status));
            }

            std::vector<float> embedding;
            try {
                auto resp_json = json::parse(response.body);
                if (!resp_json.contains("embedding")) {
                    throw ModelUnavailableError("Ollama response has no embedding field");
                }
                embedding = resp_json["embedding"].get<std::vector<float>>();
            } catch (const json::exception& e) {
                throw ModelUnavailableError(std::string("Ollama response parse error: ") + e.what());
            }

            check_dimension(embedding, "Ollama");
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_model;
        std::string m_endpoint;
        size_t m_dimension;
        long m_timeout_ms;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model,
                                                     const std::string& endpoint,
                                                     size_t dimension,
                                                     long timeout_ms) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, dimension, timeout_ms);
    }

}
