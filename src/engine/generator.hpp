#pragma once

#include <string>
#include <memory>

namespace tessera::engine {

    /**
     * @brief External text generator (LLM) behind a single call boundary.
     */
    class Generator {
    public:
        virtual ~Generator() = default;

        /**
         * @brief Completes the prompt.
         * @throws ModelUnavailableError if the model cannot respond or times out.
         */
        virtual std::string generate(const std::string& prompt) = 0;
    };

    std::unique_ptr<Generator> create_ollama_generator(const std::string& model,
                                                       const std::string& endpoint,
                                                       long timeout_ms);

}
