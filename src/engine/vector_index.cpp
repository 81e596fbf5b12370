#include "vector_index.hpp"
#include "tessera/errors.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <unordered_set>

namespace tessera::engine {

    namespace {
        constexpr size_t kInitialCapacity = 64;

        using FlatIndex = hnswlib::BruteforceSearch<float>;
    }

    struct VectorIndex::Impl {
        hnswlib::L2Space space;
        std::unique_ptr<FlatIndex> store; // null until load()

        explicit Impl(size_t dim) : space(dim) {}

        size_t element_size() {
            return space.get_data_size() + sizeof(hnswlib::labeltype);
        }

        std::unique_ptr<FlatIndex> make_empty(size_t capacity) {
            return std::make_unique<FlatIndex>(&space, capacity);
        }

        static hnswlib::labeltype label_at(const FlatIndex& index, size_t slot) {
            hnswlib::labeltype label;
            std::memcpy(&label, index.data_ + slot * index.size_per_element_ + index.data_size_, sizeof(label));
            return label;
        }

        /**
         * @brief Copies every entry not in skip into a fresh index of at least min_capacity slots.
         */
        std::unique_ptr<FlatIndex> clone(size_t min_capacity, const std::unordered_set<hnswlib::labeltype>& skip = {}) {
            size_t capacity = std::max(kInitialCapacity, store ? store->maxelements_ : size_t{0});
            while (capacity < min_capacity) capacity *= 2;

            auto next = make_empty(capacity);
            if (store) {
                for (size_t slot = 0; slot < store->cur_element_count; ++slot) {
                    auto label = label_at(*store, slot);
                    if (skip.count(label)) continue;
                    next->addPoint(store->data_ + slot * store->size_per_element_, label);
                }
            }
            return next;
        }

        /**
         * @brief Header check before handing the file to hnswlib, whose loader trusts it blindly.
         */
        void validate_file(const std::filesystem::path& path) {
            std::ifstream in(path, std::ios::binary);
            if (!in) throw IndexCorruptionError("cannot open " + path.string());

            size_t max_elements = 0, size_per_element = 0, count = 0;
            in.read(reinterpret_cast<char*>(&max_elements), sizeof(max_elements));
            in.read(reinterpret_cast<char*>(&size_per_element), sizeof(size_per_element));
            in.read(reinterpret_cast<char*>(&count), sizeof(count));
            if (!in) throw IndexCorruptionError("truncated header in " + path.string());

            if (size_per_element != element_size()) {
                throw IndexCorruptionError("element size " + std::to_string(size_per_element) +
                                           " does not match index dimension in " + path.string());
            }
            if (count > max_elements) {
                throw IndexCorruptionError("element count exceeds capacity in " + path.string());
            }

            std::error_code ec;
            auto actual = std::filesystem::file_size(path, ec);
            auto expected = 3 * sizeof(size_t) + max_elements * size_per_element;
            if (ec || actual != expected) {
                throw IndexCorruptionError("size mismatch in " + path.string() + " (expected " +
                                           std::to_string(expected) + " bytes)");
            }
        }

        // hnswlib's BruteforceSearch::loadIndex does not rebuild its label map.
        static void rebuild_labels(FlatIndex& index) {
            index.dict_external_to_internal.clear();
            for (size_t slot = 0; slot < index.cur_element_count; ++slot) {
                auto inserted = index.dict_external_to_internal.emplace(label_at(index, slot), slot);
                if (!inserted.second) {
                    throw IndexCorruptionError("duplicate id " + std::to_string(label_at(index, slot)));
                }
            }
        }

        void persist(FlatIndex& index, const std::filesystem::path& path) {
            std::error_code ec;
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path(), ec);
                if (ec) throw IndexWriteError("cannot create " + path.parent_path().string() + ": " + ec.message());
            }

            auto tmp = path;
            tmp += ".tmp";
            index.saveIndex(tmp.string());

            auto written = std::filesystem::file_size(tmp, ec);
            auto expected = 3 * sizeof(size_t) + index.maxelements_ * index.size_per_element_;
            if (ec || written != expected) {
                std::filesystem::remove(tmp, ec);
                throw IndexWriteError("short write to " + tmp.string());
            }

            std::filesystem::rename(tmp, path, ec);
            if (ec) {
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                throw IndexWriteError("cannot replace " + path.string() + ": " + ec.message());
            }
        }
    };

    VectorIndex::VectorIndex(int64_t tenant_id, size_t dim, std::filesystem::path path)
        : m_impl(std::make_unique<Impl>(dim)), m_tenant_id(tenant_id), m_dim(dim), m_path(std::move(path)) {
        if (dim == 0) throw ConfigurationError("vector dimension must be positive");
    }

    VectorIndex::~VectorIndex() = default;

    void VectorIndex::load() {
        if (m_loaded.load(std::memory_order_acquire)) return;

        std::lock_guard<std::mutex> write_lock(m_write_mutex);
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_loaded.load(std::memory_order_relaxed)) return;

        if (std::filesystem::exists(m_path)) {
            try {
                m_impl->validate_file(m_path);
                auto loaded = std::make_unique<FlatIndex>(&m_impl->space, m_path.string());
                Impl::rebuild_labels(*loaded);
                m_impl->store = std::move(loaded);
                std::cout << "[VectorIndex] Loaded index for tenant " << m_tenant_id
                          << " (" << m_impl->store->cur_element_count << " vectors)\n";
            } catch (const std::exception& e) {
                std::cerr << "[VectorIndex] Warning: index for tenant " << m_tenant_id
                          << " is unreadable (" << e.what() << "); starting empty. Run reconcile to re-index.\n";
                auto aside = m_path;
                aside += ".corrupt";
                std::error_code ec;
                std::filesystem::rename(m_path, aside, ec);
                if (ec) {
                    std::cerr << "[VectorIndex] Could not move corrupt index aside: " << ec.message() << "\n";
                }
                m_impl->store.reset();
            }
        }

        if (!m_impl->store) {
            m_impl->store = m_impl->make_empty(kInitialCapacity);
            std::cout << "[VectorIndex] Created new index for tenant " << m_tenant_id << "\n";
        }
        m_loaded.store(true, std::memory_order_release);
    }

    bool VectorIndex::loaded() const {
        return m_loaded.load(std::memory_order_acquire);
    }

    void VectorIndex::add(const std::vector<std::vector<float>>& vectors, const std::vector<int64_t>& ids) {
        if (vectors.size() != ids.size()) {
            throw ConfigurationError("add() got " + std::to_string(vectors.size()) + " vectors for " +
                                     std::to_string(ids.size()) + " ids");
        }
        for (size_t i = 0; i < vectors.size(); ++i) {
            if (vectors[i].size() != m_dim) {
                throw ConfigurationError("Vector dimension mismatch. Expected " + std::to_string(m_dim) +
                                         ", got " + std::to_string(vectors[i].size()));
            }
            if (ids[i] < 0) throw ConfigurationError("vector ids must be non-negative");
        }
        if (ids.empty()) return;

        load();

        std::lock_guard<std::mutex> write_lock(m_write_mutex);
        std::unique_ptr<FlatIndex> next;
        try {
            next = m_impl->clone(m_impl->store->cur_element_count + ids.size());
            for (size_t i = 0; i < ids.size(); ++i) {
                next->addPoint(vectors[i].data(), static_cast<hnswlib::labeltype>(ids[i]));
            }
        } catch (const std::exception& e) {
            throw IndexWriteError(std::string("cannot grow index: ") + e.what());
        }

        m_impl->persist(*next, m_path);

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_impl->store = std::move(next);
    }

    std::vector<SearchHit> VectorIndex::search(const std::vector<float>& query_vector, size_t k) const {
        std::vector<SearchHit> results;
        if (query_vector.size() != m_dim) {
            throw ConfigurationError("Query dimension mismatch. Expected " + std::to_string(m_dim) +
                                     ", got " + std::to_string(query_vector.size()));
        }

        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (!m_impl->store || m_impl->store->cur_element_count == 0 || k == 0) return results;

        k = std::min(k, m_impl->store->cur_element_count);
        // searchKnn returns a max-heap of <dist, label>
        auto pq = m_impl->store->searchKnn(query_vector.data(), k);
        results.reserve(pq.size());
        while (!pq.empty()) {
            results.push_back({pq.top().first, static_cast<int64_t>(pq.top().second)});
            pq.pop();
        }
        // Result is furthest to nearest, so reverse it
        std::reverse(results.begin(), results.end());
        return results;
    }

    size_t VectorIndex::remove(const std::vector<int64_t>& ids) {
        load();

        std::lock_guard<std::mutex> write_lock(m_write_mutex);
        std::unordered_set<hnswlib::labeltype> skip;
        for (auto id : ids) {
            if (id >= 0 && m_impl->store->dict_external_to_internal.count(static_cast<hnswlib::labeltype>(id))) {
                skip.insert(static_cast<hnswlib::labeltype>(id));
            }
        }
        if (skip.empty()) return 0;

        auto next = m_impl->clone(0, skip);
        m_impl->persist(*next, m_path);

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_impl->store = std::move(next);
        return skip.size();
    }

    bool VectorIndex::contains(int64_t id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (!m_impl->store || id < 0) return false;
        return m_impl->store->dict_external_to_internal.count(static_cast<hnswlib::labeltype>(id)) > 0;
    }

    std::vector<int64_t> VectorIndex::ids() const {
        std::vector<int64_t> out;
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (!m_impl->store) return out;
        out.reserve(m_impl->store->cur_element_count);
        for (const auto& entry : m_impl->store->dict_external_to_internal) {
            out.push_back(static_cast<int64_t>(entry.first));
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    size_t VectorIndex::size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_impl->store ? m_impl->store->cur_element_count : 0;
    }

}
