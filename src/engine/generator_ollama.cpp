#include "generator.hpp"
#include "http.hpp"
#include "tessera/errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace tessera::engine {

    class OllamaGenerator : public Generator {
    public:
        OllamaGenerator(const std::string& model, const std::string& endpoint, long timeout_ms)
            : m_model(model), m_endpoint(endpoint), m_timeout_ms(timeout_ms) {
            std::cout << "[OllamaGenerator] Model " << m_model << " at " << m_endpoint << "\n";
        }

        std::string generate(const std::string& prompt) override {
            json body = {
                {"model", m_model},
                {"prompt", prompt},
                {"stream", false},
                {"options", {{"temperature", 0.7}}}
            };
            std::string json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

            auto response = http_post_json(m_endpoint, json_str, m_timeout_ms);
            if (!response.error.empty()) {
                std::cerr << "[OllamaGenerator] Request failed: " << response.error << "\n";
                throw ModelUnavailableError("generation request failed: " + response.error, response.timed_out);
            }
            if (!response.ok()) {
                throw ModelUnavailableError("generation request returned HTTP " + std::to_string(response.status));
            }

            try {
                auto resp_json = json::parse(response.body);
                std::string answer = resp_json.value("response", std::string());
                if (answer.empty()) {
                    return "I couldn't generate a response. Please try rephrasing your question.";
                }
                return answer;
            } catch (const json::exception& e) {
                throw ModelUnavailableError(std::string("generation response parse error: ") + e.what());
            }
        }

    private:
        std::string m_model;
        std::string m_endpoint;
        long m_timeout_ms;
    };

    std::unique_ptr<Generator> create_ollama_generator(const std::string& model,
                                                       const std::string& endpoint,
                                                       long timeout_ms) {
        return std::make_unique<OllamaGenerator>(model, endpoint, timeout_ms);
    }

}
