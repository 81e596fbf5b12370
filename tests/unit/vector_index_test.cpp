#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <thread>
#include <vector>
#include "engine/vector_index.hpp"
#include "engine/index_registry.hpp"
#include "tessera/errors.hpp"
#include "support/fakes.hpp"

using tessera::engine::VectorIndex;
using tessera::engine::IndexRegistry;

class VectorIndexTest : public ::testing::Test {
protected:
    tessera::test::TempDir dir;

    std::filesystem::path index_path() const { return dir / "7.index"; }

    void fill(VectorIndex& index) {
        index.add({{0.0f, 0.0f}, {1.0f, 0.0f}, {3.0f, 0.0f}}, {10, 11, 12});
    }
};

TEST_F(VectorIndexTest, EmptyIndexReturnsNothing) {
    VectorIndex index(7, 2, index_path());
    index.load();
    EXPECT_TRUE(index.search({0.0f, 0.0f}, 5).empty());
    EXPECT_EQ(index.size(), 0u);
}

TEST_F(VectorIndexTest, UnloadedIndexBehavesEmpty) {
    VectorIndex index(7, 2, index_path());
    EXPECT_FALSE(index.loaded());
    EXPECT_TRUE(index.search({0.0f, 0.0f}, 5).empty());
    EXPECT_FALSE(index.contains(10));
}

TEST_F(VectorIndexTest, ReturnsNearestFirstBySquaredDistance) {
    VectorIndex index(7, 2, index_path());
    fill(index);

    auto hits = index.search({0.9f, 0.0f}, 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].id, 11);
    EXPECT_NEAR(hits[0].distance, 0.01f, 1e-5);
    EXPECT_EQ(hits[1].id, 10);
    EXPECT_NEAR(hits[1].distance, 0.81f, 1e-5);
}

TEST_F(VectorIndexTest, KLargerThanSizeReturnsEverything) {
    VectorIndex index(7, 2, index_path());
    fill(index);

    auto hits = index.search({0.0f, 0.0f}, 50);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].id, 10);
    EXPECT_EQ(hits[2].id, 12);
}

TEST_F(VectorIndexTest, RejectsDimensionMismatch) {
    VectorIndex index(7, 2, index_path());
    EXPECT_THROW(index.add({{1.0f, 2.0f, 3.0f}}, {1}), tessera::ConfigurationError);
    EXPECT_THROW(index.add({{1.0f, 2.0f}}, {1, 2}), tessera::ConfigurationError);
    EXPECT_THROW(index.add({{1.0f, 2.0f}}, {-4}), tessera::ConfigurationError);
    EXPECT_THROW(index.search({1.0f}, 1), tessera::ConfigurationError);
    EXPECT_THROW(VectorIndex(7, 0, index_path()), tessera::ConfigurationError);
}

TEST_F(VectorIndexTest, PersistsAcrossInstances) {
    {
        VectorIndex index(7, 2, index_path());
        fill(index);
    }
    EXPECT_TRUE(std::filesystem::exists(index_path()));
    EXPECT_FALSE(std::filesystem::exists(dir / "7.index.tmp"));

    VectorIndex reopened(7, 2, index_path());
    reopened.load();
    EXPECT_EQ(reopened.size(), 3u);
    EXPECT_EQ(reopened.ids(), (std::vector<int64_t>{10, 11, 12}));
    auto hits = reopened.search({3.0f, 0.0f}, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, 12);
}

TEST_F(VectorIndexTest, GrowsPastInitialCapacity) {
    VectorIndex index(7, 2, index_path());
    for (int batch = 0; batch < 4; ++batch) {
        std::vector<std::vector<float>> vectors;
        std::vector<int64_t> ids;
        for (int i = 0; i < 50; ++i) {
            int64_t id = batch * 50 + i;
            vectors.push_back({static_cast<float>(id), 1.0f});
            ids.push_back(id);
        }
        index.add(vectors, ids);
    }
    EXPECT_EQ(index.size(), 200u);

    VectorIndex reopened(7, 2, index_path());
    reopened.load();
    EXPECT_EQ(reopened.size(), 200u);
    auto hits = reopened.search({150.0f, 1.0f}, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, 150);
}

TEST_F(VectorIndexTest, ReAddingAnIdReplacesItsVector) {
    VectorIndex index(7, 2, index_path());
    index.add({{0.0f, 0.0f}}, {1});
    index.add({{5.0f, 5.0f}}, {1});

    EXPECT_EQ(index.size(), 1u);
    auto hits = index.search({5.0f, 5.0f}, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_FLOAT_EQ(hits[0].distance, 0.0f);
}

TEST_F(VectorIndexTest, RemoveDropsIdsAndPersists) {
    VectorIndex index(7, 2, index_path());
    fill(index);

    EXPECT_EQ(index.remove({11, 99}), 1u);
    EXPECT_FALSE(index.contains(11));
    EXPECT_TRUE(index.contains(10));

    VectorIndex reopened(7, 2, index_path());
    reopened.load();
    EXPECT_EQ(reopened.ids(), (std::vector<int64_t>{10, 12}));
}

TEST_F(VectorIndexTest, CorruptFileIsMovedAsideAndIndexStartsEmpty) {
    {
        std::ofstream out(index_path(), std::ios::binary);
        out << "definitely not an index";
    }

    VectorIndex index(7, 2, index_path());
    index.load();
    EXPECT_EQ(index.size(), 0u);
    EXPECT_TRUE(std::filesystem::exists(dir / "7.index.corrupt"));

    index.add({{1.0f, 1.0f}}, {5});
    EXPECT_TRUE(index.contains(5));
}

TEST_F(VectorIndexTest, FileWithOtherDimensionIsTreatedAsCorrupt) {
    {
        VectorIndex index(7, 2, index_path());
        fill(index);
    }
    VectorIndex wider(7, 3, index_path());
    wider.load();
    EXPECT_EQ(wider.size(), 0u);
}

TEST_F(VectorIndexTest, RegistryHandsOutOneInstancePerTenant) {
    IndexRegistry registry(dir / "indices", 2);
    auto a = registry.get(1);
    auto b = registry.get(1);
    auto c = registry.get(2);

    EXPECT_EQ(a.get(), b.get());
    EXPECT_NE(a.get(), c.get());
    EXPECT_TRUE(a->loaded());
    EXPECT_EQ(registry.loaded_count(), 2u);
    EXPECT_EQ(registry.path_for(1), dir / "indices" / "1.index");
}

TEST_F(VectorIndexTest, ConcurrentWritersLoseNoVectors) {
    VectorIndex index(7, 2, index_path());
    index.load();

    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&index, t] {
            for (int i = 0; i < kPerThread; ++i) {
                int64_t id = t * kPerThread + i;
                index.add({{static_cast<float>(id), static_cast<float>(t)}}, {id});
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_EQ(index.size(), static_cast<size_t>(kThreads * kPerThread));
    for (int64_t id = 0; id < kThreads * kPerThread; ++id) {
        EXPECT_TRUE(index.contains(id)) << id;
    }

    VectorIndex reopened(7, 2, index_path());
    reopened.load();
    EXPECT_EQ(reopened.size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(VectorIndexTest, SearchDuringWritesSeesWholeBatches) {
    IndexRegistry registry(dir / "indices", 2);
    constexpr int kBatch = 10;
    constexpr int kBatches = 20;
    std::atomic<bool> done{false};
    std::atomic<int> bad_snapshots{0};
    std::atomic<int> reads{0};

    std::thread reader([&] {
        do {
            // Through the registry, as retrieve() does
            auto hits = registry.get(3)->search({0.0f, 0.0f}, kBatch * kBatches);
            ++reads;
            if (hits.size() % kBatch != 0) ++bad_snapshots;
            for (const auto& hit : hits) {
                if (hit.id >= static_cast<int64_t>(hits.size())) ++bad_snapshots;
            }
        } while (!done);
    });

    auto index = registry.get(3);
    for (int b = 0; b < kBatches; ++b) {
        std::vector<std::vector<float>> vectors;
        std::vector<int64_t> ids;
        for (int i = 0; i < kBatch; ++i) {
            int64_t id = b * kBatch + i;
            vectors.push_back({static_cast<float>(id), 1.0f});
            ids.push_back(id);
        }
        index->add(vectors, ids);
    }
    done = true;
    reader.join();

    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(bad_snapshots.load(), 0);
    EXPECT_EQ(index->size(), static_cast<size_t>(kBatch * kBatches));
}
