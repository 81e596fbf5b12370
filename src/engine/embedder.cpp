#include "embedder.hpp"
#include "tessera/errors.hpp"

namespace tessera::engine {

    std::vector<std::vector<float>> Embedder::embed_batch(const std::vector<std::string>& texts) {
        std::vector<std::vector<float>> vectors;
        vectors.reserve(texts.size());
        for (const auto& text : texts) {
            vectors.push_back(embed(text));
        }
        return vectors;
    }

    void Embedder::check_dimension(const std::vector<float>& vec, const char* backend) const {
        if (vec.size() != dimension()) {
            throw ModelUnavailableError(std::string(backend) + " returned a " + std::to_string(vec.size()) +
                                        "-dimensional vector, expected " + std::to_string(dimension()));
        }
    }

}
