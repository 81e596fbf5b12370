#include "answer_composer.hpp"
#include "tessera/errors.hpp"

namespace tessera::engine {

    AnswerComposer::AnswerComposer(Generator& generator) : m_generator(generator) {}

    std::string AnswerComposer::build_prompt(const std::string& query, const std::vector<ScoredChunk>& chunks) {
        std::string context;
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (i > 0) context += "\n\n";
            context += chunks[i].chunk.chunk_text;
        }

        return "Based on the following context, answer the question. If the answer is not in the context, say so.\n"
               "\n"
               "Context:\n" + context + "\n"
               "\n"
               "Question: " + query + "\n"
               "\n"
               "Answer:";
    }

    std::string AnswerComposer::compose(const std::string& query, const std::vector<ScoredChunk>& chunks) {
        if (chunks.empty()) {
            throw ConfigurationError("answer composition requires at least one chunk");
        }
        return m_generator.generate(build_prompt(query, chunks));
    }

}
