#include "index_registry.hpp"
#include <iostream>

namespace tessera::engine {

    IndexRegistry::IndexRegistry(std::filesystem::path root, size_t dim)
        : m_root(std::move(root)), m_dim(dim) {
        std::error_code ec;
        std::filesystem::create_directories(m_root, ec);
        if (ec) {
            std::cerr << "[IndexRegistry] Cannot create " << m_root << ": " << ec.message() << "\n";
        }
    }

    std::filesystem::path IndexRegistry::path_for(int64_t tenant_id) const {
        return m_root / (std::to_string(tenant_id) + ".index");
    }

    std::shared_ptr<VectorIndex> IndexRegistry::get(int64_t tenant_id) {
        std::shared_ptr<VectorIndex> index;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_indices.find(tenant_id);
            if (it == m_indices.end()) {
                index = std::make_shared<VectorIndex>(tenant_id, m_dim, path_for(tenant_id));
                m_indices.emplace(tenant_id, index);
            } else {
                index = it->second;
            }
        }
        // Loading reads the file; keep it outside the registry lock so other tenants are not blocked.
        index->load();
        return index;
    }

    size_t IndexRegistry::loaded_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_indices.size();
    }

}
