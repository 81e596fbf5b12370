#include <gtest/gtest.h>
#include <fstream>
#include "engine/config.hpp"
#include "tessera/errors.hpp"
#include "support/fakes.hpp"

using tessera::engine::Config;
using tessera::engine::FreshnessPolicy;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    Config cfg;
    EXPECT_EQ(cfg.chunk_size, 500u);
    EXPECT_EQ(cfg.chunk_overlap, 250u);
    EXPECT_EQ(cfg.embedding_dimension, 384u);
    EXPECT_EQ(cfg.default_top_k, 5);
    EXPECT_DOUBLE_EQ(cfg.default_freshness_weight, 0.1);
    EXPECT_EQ(cfg.freshness_policy, FreshnessPolicy::BoostOlder);
    EXPECT_EQ(cfg.socket_name, "tessera.sock");
    EXPECT_NO_THROW(cfg.validate());
}

TEST(ConfigTest, MissingFileGivesDefaults) {
    tessera::test::TempDir dir;
    auto cfg = Config::load(dir / "config.json");
    EXPECT_EQ(cfg.embedding_backend, "ollama");
    EXPECT_EQ(cfg.chunk_size, 500u);
}

TEST(ConfigTest, LoadsOverridesAndKeepsOtherDefaults) {
    tessera::test::TempDir dir;
    {
        std::ofstream out(dir / "config.json");
        out << R"({"chunk_size": 200, "chunk_overlap": 50, "freshness_policy": "boost_newer",
                   "data_dir": "/var/lib/tessera", "embedding_backend": "openai"})";
    }
    auto cfg = Config::load(dir / "config.json");
    EXPECT_EQ(cfg.chunk_size, 200u);
    EXPECT_EQ(cfg.chunk_overlap, 50u);
    EXPECT_EQ(cfg.freshness_policy, FreshnessPolicy::BoostNewer);
    EXPECT_EQ(cfg.embedding_backend, "openai");
    EXPECT_EQ(cfg.database_path(), std::filesystem::path("/var/lib/tessera/tessera.db"));
    EXPECT_EQ(cfg.index_dir(), std::filesystem::path("/var/lib/tessera/indices"));
    EXPECT_EQ(cfg.default_top_k, 5);
}

TEST(ConfigTest, MalformedFileFallsBackToDefaults) {
    tessera::test::TempDir dir;
    {
        std::ofstream out(dir / "config.json");
        out << "{ chunk_size: ";
    }
    auto cfg = Config::load(dir / "config.json");
    EXPECT_EQ(cfg.chunk_size, 500u);
}

TEST(ConfigTest, UnknownFreshnessPolicyIsAConfigurationError) {
    nlohmann::json j = {{"freshness_policy", "sideways"}};
    EXPECT_THROW(Config::from_json(j), tessera::ConfigurationError);
}

TEST(ConfigTest, ValidateRejectsImpossibleValues) {
    Config cfg;
    cfg.chunk_overlap = cfg.chunk_size;
    EXPECT_THROW(cfg.validate(), tessera::ConfigurationError);

    cfg = Config{};
    cfg.embedding_backend = "word2vec";
    EXPECT_THROW(cfg.validate(), tessera::ConfigurationError);

    cfg = Config{};
    cfg.default_top_k = 0;
    EXPECT_THROW(cfg.validate(), tessera::ConfigurationError);
}

TEST(ConfigTest, SavedFileLoadsBack) {
    tessera::test::TempDir dir;
    Config cfg;
    cfg.llm_model = "mistral";
    cfg.freshness_policy = FreshnessPolicy::BoostNewer;
    cfg.save(dir / "config.json");

    auto loaded = Config::load(dir / "config.json");
    EXPECT_EQ(loaded.llm_model, "mistral");
    EXPECT_EQ(loaded.freshness_policy, FreshnessPolicy::BoostNewer);
}

TEST(ConfigTest, NegativeCountsAreRejectedNotWrapped) {
    for (const char* key : {"chunk_size", "chunk_overlap", "embedding_dimension"}) {
        nlohmann::json j;
        j[key] = -1;
        EXPECT_THROW(Config::from_json(j), tessera::ConfigurationError) << key;
    }

    nlohmann::json timeouts = {{"llm_timeout_ms", -1}};
    auto cfg = Config::from_json(timeouts);
    EXPECT_THROW(cfg.validate(), tessera::ConfigurationError);
}

TEST(ConfigTest, NegativeCountInFileIsAConfigurationError) {
    tessera::test::TempDir dir;
    {
        std::ofstream out(dir / "config.json");
        out << R"({"chunk_size": 100, "chunk_overlap": -10})";
    }
    EXPECT_THROW(Config::load(dir / "config.json"), tessera::ConfigurationError);
}
