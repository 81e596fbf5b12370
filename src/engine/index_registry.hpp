#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <filesystem>
#include <cstdint>
#include "vector_index.hpp"

namespace tessera::engine {

    /**
     * @brief Owns exactly one VectorIndex per tenant for the process.
     *
     * Indices are created and loaded on first access; the file for a tenant
     * is "<root>/<tenant_id>.index".
     */
    class IndexRegistry {
    public:
        IndexRegistry(std::filesystem::path root, size_t dim);

        std::shared_ptr<VectorIndex> get(int64_t tenant_id);

        std::filesystem::path path_for(int64_t tenant_id) const;

        size_t dimension() const { return m_dim; }
        size_t loaded_count() const;

    private:
        std::filesystem::path m_root;
        size_t m_dim;
        mutable std::mutex m_mutex;
        std::map<int64_t, std::shared_ptr<VectorIndex>> m_indices;
    };

}
