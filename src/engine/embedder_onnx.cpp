#include "embedder.hpp"
#include "tokenizer.hpp"
#include "tessera/errors.hpp"
#include <iostream>
#include <vector>
#include <cmath>
#include <filesystem>

#ifdef TESSERA_WITH_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace tessera::engine {

    /**
     * @brief Sentence-transformer (all-MiniLM-L6-v2 style) embedder running locally.
     *
     * Constructing the instance loads the ONNX graph and the vocabulary,
     * which takes a few hundred milliseconds; inference afterwards is
     * thread-safe (Ort::Session::Run).
     */
    class OnnxEmbedder : public Embedder {
    public:
        OnnxEmbedder(const std::string& model_path, const std::string& vocab_path) {
#ifdef TESSERA_WITH_ONNX
            if (!std::filesystem::exists(model_path) || !std::filesystem::exists(vocab_path)) {
                throw ModelUnavailableError("ONNX model or vocab file not found: " + model_path + ", " + vocab_path);
            }

            try {
                m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "tessera");

                Ort::SessionOptions session_options;
                session_options.SetIntraOpNumThreads(1);
                session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

                m_session = std::make_unique<Ort::Session>(*m_env, model_path.c_str(), session_options);
                m_tokenizer = std::make_unique<WordPieceTokenizer>(vocab_path);

                std::cout << "[OnnxEmbedder] Loaded: " << model_path << "\n";
            } catch (const Ort::Exception& e) {
                std::cerr << "[OnnxEmbedder] Initialization failed: " << e.what() << "\n";
                throw ModelUnavailableError(std::string("ONNX model initialization failed: ") + e.what());
            }
#else
            (void)model_path;
            (void)vocab_path;
            std::cerr << "[OnnxEmbedder] Compiled without ONNX Runtime support.\n";
            throw ModelUnavailableError("tessera was built without ONNX Runtime support");
#endif
        }

        std::vector<float> embed(const std::string& text) override {
            std::vector<float> embedding;
#ifdef TESSERA_WITH_ONNX
            auto input_ids = m_tokenizer->encode(text);
            const size_t seq_length = input_ids.size();

            std::vector<int64_t> token_type_ids(seq_length, 0);
            std::vector<int64_t> attention_mask(seq_length, 1);
            std::vector<int64_t> input_shape = { 1, static_cast<int64_t>(seq_length) };

            auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

            std::vector<Ort::Value> input_tensors;
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, input_ids.data(), input_ids.size(), input_shape.data(), input_shape.size()));
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, attention_mask.data(), attention_mask.size(), input_shape.data(), input_shape.size()));
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, token_type_ids.data(), token_type_ids.size(), input_shape.data(), input_shape.size()));

            const char* input_names[] = { "input_ids", "attention_mask", "token_type_ids" };
            const char* output_names[] = { "last_hidden_state" };

            try {
                auto output_tensors = m_session->Run(Ort::RunOptions{nullptr}, input_names, input_tensors.data(), 3, output_names, 1);

                // Output shape: [batch, seq, hidden]
                const float* float_data = output_tensors[0].GetTensorData<float>();
                auto shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
                const size_t hidden_size = static_cast<size_t>(shape[2]);

                embedding.assign(hidden_size, 0.0f);
                for (size_t i = 0; i < seq_length; ++i) {
                    for (size_t j = 0; j < hidden_size; ++j) {
                        embedding[j] += float_data[i * hidden_size + j];
                    }
                }

                // Mean pooling then L2 normalisation
                float norm = 0.0f;
                for (float& val : embedding) {
                    val /= static_cast<float>(seq_length);
                    norm += val * val;
                }
                norm = std::sqrt(norm);
                for (float& val : embedding) val /= (norm + 1e-9f);
            } catch (const Ort::Exception& e) {
                std::cerr << "[OnnxEmbedder] Inference failed: " << e.what() << "\n";
                throw ModelUnavailableError(std::string("ONNX inference failed: ") + e.what());
            }
#else
            (void)text;
#endif
            check_dimension(embedding, "ONNX");
            return embedding;
        }

        size_t dimension() const override { return 384; }

    private:
#ifdef TESSERA_WITH_ONNX
        std::unique_ptr<Ort::Env> m_env;
        std::unique_ptr<Ort::Session> m_session;
        std::unique_ptr<WordPieceTokenizer> m_tokenizer;
#endif
    };

    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path) {
        return std::make_unique<OnnxEmbedder>(model_path, vocab_path);
    }

}
