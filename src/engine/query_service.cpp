#include "query_service.hpp"
#include "tessera/errors.hpp"
#include <algorithm>
#include <iostream>

namespace tessera::engine {

    QueryService::QueryService(Retriever& retriever, AnswerComposer& composer)
        : m_retriever(retriever), m_composer(composer) {}

    std::string QueryService::excerpt_answer(const std::vector<ScoredChunk>& chunks) {
        const auto& text = chunks.front().chunk.chunk_text;
        size_t cut = std::min(text.size(), kExcerptBytes);
        // Never split a UTF-8 sequence: back off to the lead byte
        while (cut > 0 && cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
        return "Based on the provided context: " + text.substr(0, cut) + "...";
    }

    QueryResponse QueryService::answer(int64_t tenant_id, const std::string& query, const RetrieveOptions& options) {
        QueryResponse response;

        std::vector<ScoredChunk> chunks;
        try {
            chunks = m_retriever.retrieve(tenant_id, query, options);
        } catch (const ModelUnavailableError& e) {
            std::cerr << "[QueryService] Retrieval degraded for tenant " << tenant_id << ": " << e.what() << "\n";
        }

        if (chunks.empty()) {
            response.answer = kNoInformation;
            return response;
        }

        try {
            response.answer = m_composer.compose(query, chunks);
        } catch (const ModelUnavailableError& e) {
            std::cerr << "[QueryService] Generation degraded for tenant " << tenant_id << ": " << e.what() << "\n";
            response.answer = excerpt_answer(chunks);
        }

        response.retrieved_chunks = chunks.size();
        response.sources.reserve(chunks.size());
        for (const auto& c : chunks) {
            QuerySource source;
            source.source_id = c.chunk.source_id;
            source.version = c.chunk.version;
            source.similarity_score = c.similarity;
            source.last_updated_at = c.chunk.last_updated_at;
            response.sources.push_back(std::move(source));
        }
        return response;
    }

}
