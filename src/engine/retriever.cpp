#include "retriever.hpp"
#include "tessera/errors.hpp"
#include <algorithm>
#include <cmath>
#include <chrono>

namespace tessera::engine {

    std::string to_string(FreshnessPolicy policy) {
        return policy == FreshnessPolicy::BoostNewer ? "boost_newer" : "boost_older";
    }

    std::optional<FreshnessPolicy> parse_freshness_policy(const std::string& value) {
        if (value == "boost_older") return FreshnessPolicy::BoostOlder;
        if (value == "boost_newer") return FreshnessPolicy::BoostNewer;
        return std::nullopt;
    }

    double similarity_from_distance(double distance, double floor) {
        return 1.0 / (1.0 + std::max(distance, floor));
    }

    double freshness_score(const std::optional<TimePoint>& last_updated_at, TimePoint now,
                           double freshness_weight, const ScoringPolicy& policy) {
        if (!last_updated_at) return 1.0;

        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - *last_updated_at).count();
        double days = std::floor(static_cast<double>(age) / 86400.0);
        double sign = policy.freshness == FreshnessPolicy::BoostOlder ? 1.0 : -1.0;

        double boost = 1.0 + sign * (days / 365.0) * freshness_weight;
        return std::max(policy.min_freshness, boost);
    }

    Retriever::Retriever(MetadataStore& store, Embedder& embedder, IndexRegistry& indices,
                         ScoringPolicy policy, NowFn now)
        : m_store(store), m_embedder(embedder), m_indices(indices), m_policy(policy), m_now(std::move(now)) {}

    std::vector<ScoredChunk> Retriever::retrieve(int64_t tenant_id, const std::string& query, const RetrieveOptions& options) {
        if (options.top_k <= 0) {
            throw ConfigurationError("top_k must be positive, got " + std::to_string(options.top_k));
        }

        auto query_vector = m_embedder.embed(query);

        std::shared_ptr<const VectorIndex> index = m_indices.get(tenant_id);
        // Over-fetch so deprecated or stale candidates do not starve the result.
        auto candidates = index->search(query_vector, static_cast<size_t>(options.top_k) * m_policy.candidate_multiplier);

        return rank(tenant_id, candidates, options);
    }

    std::vector<ScoredChunk> Retriever::rank(int64_t tenant_id, const std::vector<SearchHit>& candidates,
                                             const RetrieveOptions& options) {
        if (options.top_k <= 0) {
            throw ConfigurationError("top_k must be positive, got " + std::to_string(options.top_k));
        }

        const auto now = m_now();
        std::vector<ScoredChunk> scored;
        scored.reserve(candidates.size());

        for (const auto& hit : candidates) {
            if (hit.id < 0) continue;

            auto chunk = m_store.get_chunk(tenant_id, hit.id);
            if (!chunk) continue; // stale index entry
            if (options.exclude_deprecated && chunk->is_deprecated) continue;

            ScoredChunk item;
            item.chunk_id = chunk->id;
            item.similarity = similarity_from_distance(hit.distance, m_policy.distance_floor);
            item.freshness = freshness_score(chunk->last_updated_at, now, options.freshness_weight, m_policy);
            if (chunk->is_deprecated) {
                item.similarity *= m_policy.deprecated_penalty;
            }
            item.final_score = item.similarity * item.freshness;
            item.chunk = std::move(*chunk);
            scored.push_back(std::move(item));
        }

        std::stable_sort(scored.begin(), scored.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
            return a.final_score > b.final_score;
        });
        if (scored.size() > static_cast<size_t>(options.top_k)) {
            scored.resize(static_cast<size_t>(options.top_k));
        }
        return scored;
    }

}
