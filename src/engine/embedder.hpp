#pragma once

#include <string>
#include <vector>
#include <memory>

namespace tessera::engine {

    /**
     * @brief Abstract base class for embedding generation.
     *
     * Instances are constructed once by the process (model loading or
     * client setup happens in the constructor) and shared by reference
     * between the ingestor and the retriever. Implementations must be
     * deterministic for a fixed model and safe to call from several threads.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @throws ModelUnavailableError if the model cannot respond.
         */
        virtual std::vector<float> embed(const std::string& text) = 0;

        /**
         * @brief Embeds several texts, preserving order. Defaults to one embed() per text.
         */
        virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts);

        /**
         * @brief Returns the dimension of the vectors produced by this embedder.
         */
        virtual size_t dimension() const = 0;

    protected:
        /**
         * @brief Throws ModelUnavailableError unless vec has the expected dimension.
         */
        void check_dimension(const std::vector<float>& vec, const char* backend) const;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model,
                                                     const std::string& endpoint,
                                                     size_t dimension,
                                                     long timeout_ms);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key,
                                                     const std::string& model,
                                                     size_t dimension,
                                                     long timeout_ms);
    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path);

}
