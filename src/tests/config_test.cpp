#include <gtest/gtest.h>
#include <fstream>
#include "config/config.hpp"
#include "store/store_error.hpp"
#include "test_utils.hpp"

using nebula::config::Config;
using nebula::store::InvalidInputError;
using nebula::store::NotFoundError;

class ConfigTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("nebula_config_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  std::filesystem::path write_config(const std::string& json) {
    std::filesystem::path path = test_dir / "nebula.json";
    std::ofstream(path) << json;
    return path;
  }
};

TEST_F(ConfigTest, Defaults) {
  Config config;

  EXPECT_FALSE(config.storage_dir.empty());
  EXPECT_EQ(config.storage_dir.filename(), "store");
  EXPECT_EQ(config.log_file, "nebula.log");
  EXPECT_EQ(config.log_level, "info");
  EXPECT_TRUE(config.verify_on_read);
  EXPECT_EQ(config.chunker.min_size, 4096u);
  EXPECT_EQ(config.chunker.avg_size, 8192u);
  EXPECT_EQ(config.chunker.max_size, 16384u);
  EXPECT_TRUE(config.chunker.content_defined);
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, SaveAndLoad) {
  Config config;
  config.storage_dir = test_dir / "store";
  config.log_file = "custom.log";
  config.log_level = "debug";
  config.verify_on_read = false;
  config.chunker.min_size = 1024;
  config.chunker.avg_size = 2048;
  config.chunker.max_size = 8192;
  config.chunker.content_defined = false;

  std::filesystem::path path = test_dir / "nested" / "nebula.json";
  config.save_to_file(path);
  Config loaded = Config::load_from_file(path);

  EXPECT_EQ(loaded.storage_dir, config.storage_dir);
  EXPECT_EQ(loaded.log_file, "custom.log");
  EXPECT_EQ(loaded.log_level, "debug");
  EXPECT_FALSE(loaded.verify_on_read);
  EXPECT_EQ(loaded.chunker.min_size, 1024u);
  EXPECT_EQ(loaded.chunker.avg_size, 2048u);
  EXPECT_EQ(loaded.chunker.max_size, 8192u);
  EXPECT_FALSE(loaded.chunker.content_defined);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
  Config loaded = Config::load_from_file(write_config(R"({ "log_level": "warning" })"));

  EXPECT_EQ(loaded.log_level, "warning");
  EXPECT_EQ(loaded.storage_dir, Config::default_storage_dir());
  EXPECT_EQ(loaded.chunker.avg_size, 8192u);
}

TEST_F(ConfigTest, NestedChunkerSection) {
  Config loaded = Config::load_from_file(write_config(R"({
    "storage_dir": "/var/lib/nebula",
    "chunker": { "min_size": 2048, "avg_size": 4096, "max_size": 32768 }
  })"));

  EXPECT_EQ(loaded.storage_dir, std::filesystem::path("/var/lib/nebula"));
  EXPECT_EQ(loaded.chunker.min_size, 2048u);
  EXPECT_EQ(loaded.chunker.avg_size, 4096u);
  EXPECT_EQ(loaded.chunker.max_size, 32768u);
  EXPECT_TRUE(loaded.chunker.content_defined);
}

TEST_F(ConfigTest, MissingFileIsNotFound) {
  EXPECT_THROW(Config::load_from_file(test_dir / "absent.json"), NotFoundError);
}

TEST_F(ConfigTest, MalformedFileIsInvalid) {
  EXPECT_THROW(Config::load_from_file(write_config("{ not json")), InvalidInputError);
  EXPECT_THROW(Config::load_from_file(write_config(R"({ "chunker": { "min_size": "big" } })")), InvalidInputError);
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
  EXPECT_THROW(Config::load_from_file(write_config(R"({ "log_level": "loud" })")), InvalidInputError);
  EXPECT_THROW(Config::load_from_file(write_config(R"({ "chunker": { "min_size": 65536 } })")), InvalidInputError);

  Config config;
  config.storage_dir.clear();
  EXPECT_THROW(config.validate(), InvalidInputError);
}

TEST_F(ConfigTest, NegativeOrZeroBoundsAreInvalid) {
  for (const std::string& json : {R"({ "chunker": { "max_size": -1 } })",
                                   R"({ "chunker": { "min_size": 0 } })",
                                   R"({ "chunker": { "avg_size": "-8192" } })",
                                   R"({ "chunker": { "min_size": "4096 bytes" } })"}) {
    try {
      Config::load_from_file(write_config(json));
      FAIL() << "Expected InvalidInputError for " << json;
    } catch (const InvalidInputError& e) {
      EXPECT_EQ(e.kind(), nebula::store::ErrorKind::INVALID_INPUT) << json;
    }
  }
}

TEST_F(ConfigTest, OversizedBoundIsInvalid) {
  EXPECT_THROW(Config::load_from_file(write_config(R"({ "chunker": { "max_size": 18446744073709551615 } })")),
               InvalidInputError);
  EXPECT_THROW(Config::load_from_file(write_config(R"({ "chunker": { "max_size": 134217728 } })")),
               InvalidInputError);
}

TEST_F(ConfigTest, MalformedScalarValuesAreInvalid) {
  EXPECT_THROW(Config::load_from_file(write_config(R"({ "verify_on_read": "sometimes" })")), InvalidInputError);
  EXPECT_THROW(Config::load_from_file(write_config(R"({ "chunker": { "content_defined": "maybe" } })")),
               InvalidInputError);
}
