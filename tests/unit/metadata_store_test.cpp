#include <gtest/gtest.h>
#include "engine/metadata_store.hpp"
#include "tessera/errors.hpp"
#include "support/fakes.hpp"

using namespace tessera::engine;

class MetadataStoreTest : public ::testing::Test {
protected:
    MetadataStore store;

    void SetUp() override {
        ASSERT_TRUE(store.open(":memory:"));
    }

    Document make_document(int64_t tenant, const std::string& source_id, int version) {
        IngestRequest request;
        request.tenant_id = tenant;
        request.source_id = source_id;
        request.version = version;
        request.name = source_id;
        auto source = store.find_or_create_source(tenant, SourceType::Api, source_id, source_id);
        return store.create_document(request, source.id);
    }
};

TEST_F(MetadataStoreTest, SourceLookupOrInsertIsIdempotent) {
    auto first = store.find_or_create_source(1, SourceType::Api, "faq", "FAQ");
    auto second = store.find_or_create_source(1, SourceType::Api, "faq", "FAQ renamed");
    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(second.name, "FAQ");

    auto other_tenant = store.find_or_create_source(2, SourceType::Api, "faq", "FAQ");
    EXPECT_NE(first.id, other_tenant.id);
    EXPECT_EQ(store.tenants(), (std::vector<int64_t>{1, 2}));
}

TEST_F(MetadataStoreTest, DocumentsAreUniqueByTenantSourceVersion) {
    auto doc = make_document(1, "faq", 1);
    auto found = store.find_document(1, "faq", 1);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, doc.id);
    EXPECT_FALSE(store.find_document(1, "faq", 2).has_value());
    EXPECT_FALSE(store.find_document(2, "faq", 1).has_value());

    IngestRequest duplicate;
    duplicate.tenant_id = 1;
    duplicate.source_id = "faq";
    duplicate.version = 1;
    EXPECT_THROW(store.create_document(duplicate, doc.knowledge_source_id), tessera::StoreError);
}

TEST_F(MetadataStoreTest, ChunksStartUnconfirmedUntilVectorsAreConfirmed) {
    auto doc = make_document(1, "faq", 1);
    auto ids = store.insert_chunks(doc, {"one", "two", "three"});
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_LT(ids[0], ids[1]);

    auto chunks = store.chunks_for_document(1, doc.id);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].chunk_index, 2);
    EXPECT_EQ(chunks[2].chunk_text, "three");
    EXPECT_EQ(chunks[2].source_id, "faq");
    EXPECT_FALSE(chunks[0].vector_id.has_value());
    EXPECT_EQ(store.unconfirmed_chunks(1).size(), 3u);

    store.confirm_vectors({ids[0], ids[1]});
    auto pending = store.unconfirmed_chunks(1, doc.id);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, ids[2]);

    auto confirmed = store.get_chunk(1, ids[0]);
    ASSERT_TRUE(confirmed.has_value());
    ASSERT_TRUE(confirmed->vector_id.has_value());
    EXPECT_EQ(*confirmed->vector_id, ids[0]);
    EXPECT_EQ(store.confirmed_chunks(1).size(), 2u);
}

TEST_F(MetadataStoreTest, ChunkLookupIsTenantScoped) {
    auto doc = make_document(1, "faq", 1);
    auto ids = store.insert_chunks(doc, {"secret"});
    EXPECT_TRUE(store.get_chunk(1, ids[0]).has_value());
    EXPECT_FALSE(store.get_chunk(2, ids[0]).has_value());
}

TEST_F(MetadataStoreTest, UncommittedTransactionRollsBack) {
    {
        MetadataStore::Transaction tx(store);
        store.find_or_create_source(1, SourceType::Api, "draft", "draft");
    }
    EXPECT_FALSE(store.find_source(1, "draft").has_value());

    {
        MetadataStore::Transaction tx(store);
        store.find_or_create_source(1, SourceType::ManualUpload, "kept", "kept");
        tx.commit();
    }
    auto kept = store.find_source(1, "kept");
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(kept->source_type, SourceType::ManualUpload);
}

TEST_F(MetadataStoreTest, DeprecationTargetsSourceOrSingleVersion) {
    auto v1 = make_document(1, "faq", 1);
    auto v2 = make_document(1, "faq", 2);
    store.insert_chunks(v1, {"a", "b"});
    store.insert_chunks(v2, {"c"});

    EXPECT_EQ(store.set_deprecated(1, "faq", 1, true), 2u);
    for (const auto& c : store.chunks_for_document(1, v1.id)) EXPECT_TRUE(c.is_deprecated);
    for (const auto& c : store.chunks_for_document(1, v2.id)) EXPECT_FALSE(c.is_deprecated);

    EXPECT_EQ(store.set_deprecated(1, "faq", std::nullopt, false), 3u);
    EXPECT_EQ(store.set_deprecated(2, "faq", std::nullopt, true), 0u);
}

TEST_F(MetadataStoreTest, LastUpdatedIsWrittenToDocumentChunks) {
    auto doc = make_document(1, "faq", 1);
    store.insert_chunks(doc, {"a", "b"});

    auto when = TimePoint(std::chrono::seconds(1600000000));
    EXPECT_EQ(store.set_last_updated(1, doc.id, when), 2u);
    for (const auto& c : store.chunks_for_document(1, doc.id)) {
        ASSERT_TRUE(c.last_updated_at.has_value());
        EXPECT_TRUE(*c.last_updated_at == when);
    }
    auto reread = store.find_document(1, "faq", 1);
    ASSERT_TRUE(reread.has_value());
    EXPECT_TRUE(reread->last_updated_at == when);
}

TEST_F(MetadataStoreTest, CountsArePerTenant) {
    auto doc = make_document(1, "faq", 1);
    store.insert_chunks(doc, {"a", "b"});
    make_document(2, "faq", 1);

    EXPECT_EQ(store.count_documents(1), 1u);
    EXPECT_EQ(store.count_chunks(1), 2u);
    EXPECT_EQ(store.count_chunks(2), 0u);
}

TEST(MetadataStoreFileTest, DataSurvivesReopen) {
    tessera::test::TempDir dir;
    auto path = dir / "data" / "tessera.db";
    {
        MetadataStore store;
        ASSERT_TRUE(store.open(path));
        store.find_or_create_source(3, SourceType::DirectoryIngestion, "docs", "docs");
    }
    MetadataStore store;
    ASSERT_TRUE(store.open(path));
    auto source = store.find_source(3, "docs");
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source->source_type, SourceType::DirectoryIngestion);
}
