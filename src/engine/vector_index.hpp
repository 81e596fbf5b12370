#pragma once

#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <shared_mutex>
#include <filesystem>
#include <cstdint>
#include "tessera/types.hpp"

namespace tessera::engine {

    /**
     * @brief Exact L2 similarity index for one tenant, persisted to one file.
     *
     * Mutations are copy-on-write: the new state is built and written to a
     * temporary file beside the index, renamed over it, and only then
     * published to readers. Readers therefore see either the state before
     * or after a write, both in memory and on disk. Writers are serialised.
     */
    class VectorIndex {
    public:
        VectorIndex(int64_t tenant_id, size_t dim, std::filesystem::path path);
        ~VectorIndex();

        VectorIndex(const VectorIndex&) = delete;
        VectorIndex& operator=(const VectorIndex&) = delete;

        /**
         * @brief Loads the persisted file, or starts empty. Idempotent.
         *
         * Once loaded this returns without locking, so readers never wait on a writer here.
         *
         * A corrupt or foreign file is moved aside to "<file>.corrupt", logged,
         * and replaced by an empty index.
         */
        void load();

        bool loaded() const;

        /**
         * @brief Adds (vector, id) pairs and persists before returning.
         *
         * Re-adding an existing id replaces its vector.
         * @throws ConfigurationError on size or dimension mismatch or a negative id.
         * @throws IndexWriteError if the file could not be written; the index is unchanged.
         */
        void add(const std::vector<std::vector<float>>& vectors, const std::vector<int64_t>& ids);

        /**
         * @brief Up to k nearest entries by squared L2 distance, nearest first.
         *
         * Queries against an index that was never loaded see it as empty.
         */
        std::vector<SearchHit> search(const std::vector<float>& query_vector, size_t k) const;

        /**
         * @brief Drops the given ids and persists. Returns how many were present.
         */
        size_t remove(const std::vector<int64_t>& ids);

        bool contains(int64_t id) const;
        std::vector<int64_t> ids() const;
        size_t size() const;

        size_t dimension() const { return m_dim; }
        int64_t tenant_id() const { return m_tenant_id; }
        const std::filesystem::path& path() const { return m_path; }

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;

        int64_t m_tenant_id;
        size_t m_dim;
        std::filesystem::path m_path;

        mutable std::shared_mutex m_mutex; // guards the published state
        std::mutex m_write_mutex;          // one writer at a time
        std::atomic<bool> m_loaded{false};
    };

}
