#pragma once

#include <string>
#include "tessera/types.hpp"
#include "retriever.hpp"
#include "answer_composer.hpp"

namespace tessera::engine {

    /**
     * @brief Synchronous query path: retrieve, then compose.
     *
     * Model outages degrade the answer instead of failing the request:
     * an unavailable embedder yields the "no information" answer, an
     * unavailable generator yields an excerpt of the best chunk.
     */
    class QueryService {
    public:
        static constexpr const char* kNoInformation = "No relevant information found in the knowledge base.";
        static constexpr size_t kExcerptBytes = 200;

        QueryService(Retriever& retriever, AnswerComposer& composer);

        /**
         * @throws ConfigurationError if options.top_k <= 0.
         */
        QueryResponse answer(int64_t tenant_id, const std::string& query, const RetrieveOptions& options);

    private:
        Retriever& m_retriever;
        AnswerComposer& m_composer;

        static std::string excerpt_answer(const std::vector<ScoredChunk>& chunks);
    };

}
