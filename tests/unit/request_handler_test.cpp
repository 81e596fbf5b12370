#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include "engine/request_handler.hpp"
#include "engine/ingest_worker.hpp"
#include "support/fakes.hpp"

using namespace tessera::engine;
using json = nlohmann::json;
using tessera::test::FailingGenerator;
using tessera::test::HashEmbedder;
using tessera::test::RecordingGenerator;
using tessera::test::TempDir;

class RequestHandlerTest : public ::testing::Test {
protected:
    TempDir dir;
    MetadataStore store;
    HashEmbedder embedder{64};
    IndexRegistry indices{dir / "indices", 64};
    RecordingGenerator generator{"From the handbook."};
    JobQueue queue;
    std::unique_ptr<Ingestor> ingestor;
    std::unique_ptr<Retriever> retriever;
    std::unique_ptr<AnswerComposer> composer;
    std::unique_ptr<QueryService> queries;
    std::unique_ptr<TextExtractor> extractor = create_plain_text_extractor();
    std::unique_ptr<RequestHandler> handler;
    bool shutdown_requested = false;

    void SetUp() override {
        ASSERT_TRUE(store.open(":memory:"));
        ingestor = std::make_unique<Ingestor>(store, embedder, indices, ChunkingOptions{50, 10});
        retriever = std::make_unique<Retriever>(store, embedder, indices);
        composer = std::make_unique<AnswerComposer>(generator);
        queries = std::make_unique<QueryService>(*retriever, *composer);
        handler = std::make_unique<RequestHandler>(
            RequestHandler::Services{store, indices, *ingestor, *queries, *extractor, queue},
            RetrieveOptions{}, [this] { shutdown_requested = true; });
    }

    json call(const std::string& method, const json& params = json::object()) {
        return json::parse(handler->handle(json{{"method", method}, {"params", params}}.dump()));
    }
};

TEST_F(RequestHandlerTest, Ping) {
    EXPECT_EQ(call("ping")["result"], "pong");
}

TEST_F(RequestHandlerTest, IngestThenQuery) {
    auto ingested = call("ingest", {{"tenant_id", 4}, {"source_id", "handbook"}, {"version", 2},
                                    {"content", "Vacation requests need two weeks notice."}});
    ASSERT_TRUE(ingested.contains("result")) << ingested.dump();
    EXPECT_EQ(ingested["result"]["status"], "created");
    EXPECT_EQ(ingested["result"]["chunk_count"], 1);

    auto answer = call("query", {{"tenant_id", 4}, {"query", "vacation notice"}});
    ASSERT_TRUE(answer.contains("result")) << answer.dump();
    EXPECT_EQ(answer["result"]["answer"], "From the handbook.");
    EXPECT_EQ(answer["result"]["retrieved_chunks"], 1);
    EXPECT_EQ(answer["result"]["sources"][0]["source_id"], "handbook");
    EXPECT_EQ(answer["result"]["sources"][0]["version"], 2);
    EXPECT_TRUE(answer["result"]["sources"][0]["last_updated_at"].is_string());

    auto status = call("status");
    ASSERT_EQ(status["result"]["tenants"].size(), 1u);
    EXPECT_EQ(status["result"]["tenants"][0]["tenant_id"], 4);
    EXPECT_EQ(status["result"]["tenants"][0]["vectors"], 1);
}

TEST_F(RequestHandlerTest, AsyncIngestReturnsTaskIdWithTrackableStatus) {
    auto reply = call("ingest", {{"tenant_id", 1}, {"source_id", "later"}, {"content", "queued text"}, {"async", true}});
    ASSERT_TRUE(reply.contains("result")) << reply.dump();
    EXPECT_EQ(reply["result"]["status"], "pending");
    auto task_id = reply["result"]["task_id"].get<uint64_t>();
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(store.count_documents(1), 0u);

    EXPECT_EQ(call("task_status", {{"task_id", task_id}})["result"]["status"], "pending");

    IngestWorker worker(*ingestor, queue, 3, std::chrono::milliseconds(0));
    queue.stop();
    worker.run();

    auto done = call("task_status", {{"task_id", task_id}});
    ASSERT_TRUE(done.contains("result")) << done.dump();
    EXPECT_EQ(done["result"]["status"], "completed");
    EXPECT_EQ(done["result"]["attempts"], 1);
    EXPECT_EQ(done["result"]["result"]["status"], "created");
    EXPECT_EQ(store.count_documents(1), 1u);

    EXPECT_EQ(call("task_status", {{"task_id", 4242}})["error"]["type"], "RequestError");
    EXPECT_EQ(call("task_status")["error"]["type"], "RequestError");
}

TEST_F(RequestHandlerTest, AsyncUploadExtractsNowAndIngestsLater) {
    auto path = dir / "faq.md";
    {
        std::ofstream out(path);
        out << "# FAQ\nThe office closes at five.";
    }
    auto reply = call("upload", {{"tenant_id", 2}, {"path", path.string()}, {"async", true}});
    ASSERT_TRUE(reply.contains("result")) << reply.dump();
    ASSERT_EQ(queue.size(), 1u);

    IngestJob job;
    ASSERT_TRUE(queue.pop(job));
    EXPECT_EQ(job.id, reply["result"]["task_id"].get<uint64_t>());
    EXPECT_EQ(job.request.source_type, SourceType::ManualUpload);
    EXPECT_EQ(job.request.name, "faq.md");
    EXPECT_EQ(job.request.content, "# FAQ\nThe office closes at five.");

    auto unsupported = dir / "sheet.xlsx";
    {
        std::ofstream out(unsupported);
        out << "cells";
    }
    auto rejected = call("upload", {{"tenant_id", 2}, {"path", unsupported.string()}, {"async", true}});
    EXPECT_EQ(rejected["error"]["type"], "ExtractionError");
    EXPECT_EQ(queue.size(), 0u);
}

TEST_F(RequestHandlerTest, UploadReadsFileFromDisk) {
    auto path = dir / "notes.txt";
    {
        std::ofstream out(path);
        out << "Parking is free after six.";
    }
    auto reply = call("upload", {{"tenant_id", 2}, {"path", path.string()}});
    ASSERT_TRUE(reply.contains("result")) << reply.dump();
    EXPECT_EQ(reply["result"]["status"], "created");

    auto missing = call("upload", {{"tenant_id", 2}, {"path", (dir / "gone.txt").string()}});
    EXPECT_EQ(missing["error"]["type"], "ExtractionError");
}

TEST_F(RequestHandlerTest, DeprecateAndReconcile) {
    call("ingest", {{"tenant_id", 1}, {"source_id", "old"}, {"content", "Legacy process."}});

    auto deprecated = call("deprecate", {{"tenant_id", 1}, {"source_id", "old"}});
    EXPECT_EQ(deprecated["result"]["updated_chunks"], 1);

    auto answer = call("query", {{"tenant_id", 1}, {"query", "legacy process"}});
    EXPECT_EQ(answer["result"]["answer"], QueryService::kNoInformation);

    auto reports = call("reconcile");
    ASSERT_EQ(reports["result"].size(), 1u);
    EXPECT_EQ(reports["result"][0]["consistent"], true);
}

TEST_F(RequestHandlerTest, ErrorsCarryTypeAndRetryability) {
    auto bad_top_k = call("query", {{"tenant_id", 1}, {"query", "x"}, {"top_k", 0}});
    EXPECT_EQ(bad_top_k["error"]["type"], "ConfigurationError");
    EXPECT_EQ(bad_top_k["error"]["retryable"], false);

    EXPECT_EQ(call("query", {{"query", "x"}})["error"]["type"], "RequestError");
    EXPECT_EQ(call("frobnicate")["error"]["type"], "RequestError");
    EXPECT_EQ(call("ingest", {{"tenant_id", 1}, {"source_id", "s"}, {"source_type", "fax"}})["error"]["type"],
              "RequestError");

    auto garbage = json::parse(handler->handle("not json"));
    EXPECT_EQ(garbage["error"]["type"], "RequestError");
}

TEST_F(RequestHandlerTest, ShutdownInvokesCallback) {
    EXPECT_EQ(call("shutdown")["result"], "shutting down");
    EXPECT_TRUE(shutdown_requested);
}

TEST_F(RequestHandlerTest, InvalidUtf8InRequestStillGetsAReply) {
    std::string reply;
    ASSERT_NO_THROW(reply = handler->handle("\xFF"));
    auto parsed = json::parse(reply);
    EXPECT_EQ(parsed["error"]["type"], "RequestError");

    ASSERT_NO_THROW(reply = handler->handle("{\"method\": \"\xC3\"}"));
    EXPECT_EQ(json::parse(reply)["error"]["type"], "RequestError");
}

TEST_F(RequestHandlerTest, ExcerptFallbackAroundMultibyteTextIsValidJson) {
    FailingGenerator offline;
    AnswerComposer offline_composer(offline);
    QueryService offline_queries(*retriever, offline_composer);
    RequestHandler offline_handler(
        RequestHandler::Services{store, indices, *ingestor, offline_queries, *extractor, queue},
        RetrieveOptions{}, nullptr);

    std::string content = std::string(199, 'a') + "\xC3\xA9 tail";
    ingestor->ingest(ingest_request_from_json({{"tenant_id", 5}, {"source_id", "accents"}, {"content", content}}));

    std::string raw;
    ASSERT_NO_THROW(raw = offline_handler.handle(
        json{{"method", "query"}, {"params", {{"tenant_id", 5}, {"query", "tail"}}}}.dump()));
    auto reply = json::parse(raw);
    ASSERT_TRUE(reply.contains("result")) << raw;
    EXPECT_EQ(reply["result"]["answer"], "Based on the provided context: " + std::string(199, 'a') + "...");
}
