#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include "tessera/types.hpp"
#include "metadata_store.hpp"
#include "embedder.hpp"
#include "index_registry.hpp"

namespace tessera::engine {

    /**
     * @brief Direction of the age term in the freshness multiplier.
     *
     * BoostOlder: 1 + (days / 365) * weight, the established behaviour where
     * older content gains score as the weight grows. BoostNewer flips the sign.
     */
    enum class FreshnessPolicy {
        BoostOlder,
        BoostNewer
    };

    std::string to_string(FreshnessPolicy policy);
    std::optional<FreshnessPolicy> parse_freshness_policy(const std::string& value);

    struct ScoringPolicy {
        FreshnessPolicy freshness = FreshnessPolicy::BoostOlder;
        double min_freshness = 0.1;
        double deprecated_penalty = 0.1;
        double distance_floor = 0.001;
        size_t candidate_multiplier = 2;
    };

    /**
     * @brief 1 / (1 + max(distance, floor)), in (0, 1].
     */
    double similarity_from_distance(double distance, double floor);

    /**
     * @brief Freshness multiplier; a missing timestamp is neutral (1.0).
     */
    double freshness_score(const std::optional<TimePoint>& last_updated_at, TimePoint now,
                           double freshness_weight, const ScoringPolicy& policy);

    class Retriever {
    public:
        using NowFn = std::function<TimePoint()>;

        Retriever(MetadataStore& store, Embedder& embedder, IndexRegistry& indices,
                  ScoringPolicy policy = {}, NowFn now = &Clock::now);

        /**
         * @brief Ranked chunks for the query, most relevant first; empty when nothing matches.
         * @throws ConfigurationError if top_k <= 0.
         * @throws ModelUnavailableError if the query cannot be embedded.
         */
        std::vector<ScoredChunk> retrieve(int64_t tenant_id, const std::string& query, const RetrieveOptions& options);

        /**
         * @brief Filters, scores and orders index candidates (already nearest-first).
         */
        std::vector<ScoredChunk> rank(int64_t tenant_id, const std::vector<SearchHit>& candidates,
                                      const RetrieveOptions& options);

        const ScoringPolicy& policy() const { return m_policy; }

    private:
        MetadataStore& m_store;
        Embedder& m_embedder;
        IndexRegistry& m_indices;
        ScoringPolicy m_policy;
        NowFn m_now;
    };

}
