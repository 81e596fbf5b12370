#include "embedder.hpp"
#include "http.hpp"
#include "tessera/errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace tessera::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model, size_t dimension, long timeout_ms)
            : m_api_key(api_key), m_model(model), m_dimension(dimension), m_timeout_ms(timeout_ms) {
            if (m_api_key.empty()) {
                throw ModelUnavailableError("OpenAI embedder requires an API key");
            }
        }

        std::vector<float> embed(const std::string& text) override {
            auto vectors = request(json(text), 1);
            return std::move(vectors.front());
        }

        // The embeddings endpoint accepts an array input, so a batch is one round-trip.
        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
            if (texts.empty()) return {};
            return request(json(texts), texts.size());
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_api_key;
        std::string m_model;
        size_t m_dimension;
        long m_timeout_ms;

        std::vector<std::vector<float>> request(const json& input, size_t expected) {
            json body = {
                {"model", m_model},
                {"input", input},
                {"dimensions", m_dimension}
            };
            std::string json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

            auto response = http_post_json("https://api.openai.com/v1/embeddings", json_str, m_timeout_ms,
                                           {"Authorization: Bearer " + m_api_key});
            if (!response.error.empty()) {
                std::cerr << "[OpenAIEmbedder] Request failed: " << response.error << "\n";
                throw ModelUnavailableError("OpenAI embedding request failed: " + response.error, response.timed_out);
            }

            std::vector<std::vector<float>> vectors(expected);
            try {
                auto resp_json = json::parse(response.body);
                if (resp_json.contains("error")) {
                    std::cerr << "[OpenAIEmbedder] API Error: " << resp_json["error"].dump() << "\n";
                    throw ModelUnavailableError("OpenAI API error: " + resp_json["error"].value("message", std::string("unknown")));
                }
                if (!response.ok() || !resp_json.contains("data") || resp_json["data"].size() != expected) {
                    throw ModelUnavailableError("OpenAI embedding response malformed (HTTP " + std::to_string(response.status) + ")");
                }
                for (const auto& item : resp_json["data"]) {
                    size_t index = item.value("index", size_t{0});
                    if (index >= expected) {
                        throw ModelUnavailableError("OpenAI embedding response index out of range");
                    }
                    vectors[index] = item["embedding"].get<std::vector<float>>();
                }
            } catch (const json::exception& e) {
                throw ModelUnavailableError(std::string("OpenAI response parse error: ") + e.what());
            }

            for (const auto& vec : vectors) check_dimension(vec, "OpenAI");
            return vectors;
        }
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key,
                                                     const std::string& model,
                                                     size_t dimension,
                                                     long timeout_ms) {
        return std::make_unique<OpenAIEmbedder>(api_key, model, dimension, timeout_ms);
    }

}
