#pragma once

#include <string>
#include <vector>
#include "tessera/types.hpp"
#include "generator.hpp"

namespace tessera::engine {

    class AnswerComposer {
    public:
        explicit AnswerComposer(Generator& generator);

        /**
         * @brief Context is the chunk texts in ranked order separated by a blank line.
         */
        static std::string build_prompt(const std::string& query, const std::vector<ScoredChunk>& chunks);

        /**
         * @throws ConfigurationError if chunks is empty; callers answer "no information" instead.
         * @throws ModelUnavailableError from the generator.
         */
        std::string compose(const std::string& query, const std::vector<ScoredChunk>& chunks);

    private:
        Generator& m_generator;
    };

}
