#include <gtest/gtest.h>
#include <fstream>
#include "node/storage_root.hpp"
#include "store/store_error.hpp"
#include "test_utils.hpp"

using namespace nebula::node;
using nebula::store::ErrorKind;
using nebula::store::InvalidInputError;
using nebula::store::IoError;

class StorageRootTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("nebula_storage_root_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }
};

TEST_F(StorageRootTest, CreatesLayout) {
  std::filesystem::path root_dir = test_dir / "fresh";
  StorageRoot root(root_dir);

  EXPECT_TRUE(root.is_open());
  EXPECT_EQ(root.root(), root_dir);
  EXPECT_TRUE(std::filesystem::is_directory(root_dir / "objects"));
  EXPECT_TRUE(std::filesystem::is_directory(root_dir / "files"));
  EXPECT_TRUE(std::filesystem::is_directory(root_dir / "tmp"));
  EXPECT_TRUE(std::filesystem::is_regular_file(root_dir / "VERSION"));
  EXPECT_TRUE(std::filesystem::is_regular_file(root_dir / "node.id"));
  EXPECT_EQ(root.node_id().size(), 36u);
}

TEST_F(StorageRootTest, ReopeningKeepsNodeIdAndData) {
  std::string node_id;
  nebula::crypto::Digest digest;
  {
    StorageRoot root(test_dir);
    node_id = root.node_id();
    digest = root.chunk_store().put(random_bytes(100));
  }

  StorageRoot reopened(test_dir);
  EXPECT_EQ(reopened.node_id(), node_id);
  EXPECT_TRUE(reopened.chunk_store().contains(digest));
}

TEST_F(StorageRootTest, UnsupportedLayoutIsRejected) {
  std::ofstream(test_dir / "VERSION") << "nebula-store 99\n";

  try {
    StorageRoot root(test_dir);
    FAIL() << "Expected InvalidInputError";
  } catch (const InvalidInputError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::INVALID_INPUT);
  }
}

TEST_F(StorageRootTest, AccessAfterShutdownFails) {
  StorageRoot root(test_dir);
  root.shutdown();

  EXPECT_FALSE(root.is_open());
  EXPECT_THROW(root.chunk_store(), IoError);
  EXPECT_THROW(root.file_registry(), IoError);

  // Second shutdown is a no-op
  EXPECT_NO_THROW(root.shutdown());
}

TEST_F(StorageRootTest, IndependentRootsInOneProcess) {
  StorageRoot first(test_dir / "a");
  StorageRoot second(test_dir / "b");

  EXPECT_NE(first.node_id(), second.node_id());

  auto digest = first.chunk_store().put(random_bytes(64, 1));
  EXPECT_TRUE(first.chunk_store().contains(digest));
  EXPECT_FALSE(second.chunk_store().contains(digest));
}

TEST_F(StorageRootTest, SharedRootSeesSameContent) {
  StorageRoot first(test_dir);
  StorageRoot second(test_dir);

  EXPECT_EQ(first.node_id(), second.node_id());

  auto digest = first.chunk_store().put(random_bytes(64, 2));
  EXPECT_TRUE(second.chunk_store().contains(digest));
}

TEST_F(StorageRootTest, FreshRootUnderMissingParents) {
  std::filesystem::path root_dir = test_dir / "one" / "two" / "root";
  {
    StorageRoot root(root_dir);
    root.chunk_store().put(random_bytes(32, 3));
  }

  for (const char* name : {"objects", "files", "tmp"}) {
    EXPECT_TRUE(std::filesystem::is_directory(root_dir / name)) << name;
  }
  StorageRoot reopened(root_dir);
  EXPECT_EQ(reopened.chunk_store().stats().chunk_count, 1u);
}
