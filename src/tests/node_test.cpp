#include <gtest/gtest.h>
#include <sstream>
#include "node/node.hpp"
#include "store/store_error.hpp"
#include "test_utils.hpp"

using namespace nebula::node;
using namespace nebula::store;
using nebula::crypto::Hasher;
using nebula::registry::FileId;
using nebula::registry::FileRecord;
using nebula::registry::id_to_string;
using nebula::registry::short_id;

class NodeTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path input_dir;
  std::filesystem::path output_dir;
  std::unique_ptr<StorageRoot> root;
  std::unique_ptr<Node> node;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("nebula_node_test");
    input_dir = test_dir / "input";
    output_dir = test_dir / "output";
    std::filesystem::create_directories(input_dir);
    std::filesystem::create_directories(output_dir);
    open_node();
  }

  void TearDown() override {
    node.reset();
    root.reset();
    std::filesystem::remove_all(test_dir);
  }

  void open_node(bool verify_on_read = true) {
    node.reset();
    root = std::make_unique<StorageRoot>(test_dir / "store", verify_on_read);
    node = std::make_unique<Node>(*root);
  }

  std::filesystem::path make_input(const std::string& name, const std::vector<uint8_t>& data) {
    std::filesystem::path path = input_dir / name;
    write_test_file(path, data);
    return path;
  }

  // Stores data under a name and checks it comes back byte for byte
  void expect_round_trip(const std::string& name, const std::vector<uint8_t>& data) {
    FileId id = node->put_file(make_input(name, data));
    std::filesystem::path out = output_dir / (name + ".out");

    FileRecord record = node->get_file(id_to_string(id), out);
    EXPECT_EQ(record.id, id);
    EXPECT_EQ(record.filename, name);
    EXPECT_EQ(record.total_size, data.size());
    EXPECT_EQ(read_test_file(out), data) << name;
  }
};

TEST_F(NodeTest, RoundTripsAcrossSizes) {
  const ChunkerConfig& config = node->chunker_config();

  expect_round_trip("empty.bin", {});
  expect_round_trip("one_byte.bin", {0x7F});
  expect_round_trip("below_min.bin", random_bytes(config.min_size - 1, 1));
  expect_round_trip("at_min.bin", random_bytes(config.min_size, 2));
  expect_round_trip("at_max.bin", random_bytes(config.max_size, 3));
  expect_round_trip("multi_chunk.bin", random_bytes(300 * 1024, 4));
}

TEST_F(NodeTest, EmptyFileHasNoChunks) {
  FileId id = node->put_file(make_input("empty.bin", {}));
  FileRecord record = root->file_registry().lookup(id);

  EXPECT_TRUE(record.chunks.empty());
  EXPECT_EQ(record.total_size, 0u);
  EXPECT_EQ(record.file_digest, Hasher::digest(std::string()));
}

TEST_F(NodeTest, PutStream) {
  auto data = random_bytes(50000, 8);
  std::stringstream input(bytes_to_string(data));
  FileId id = node->put_stream("from-stream.bin", input);

  std::filesystem::path out = output_dir / "stream.out";
  node->get_file(short_id(id), out);
  EXPECT_EQ(read_test_file(out), data);
}

TEST_F(NodeTest, DuplicateContentIsStoredOnce) {
  auto data = random_bytes(10 * 1024 * 1024, 2024);
  FileId first = node->put_file(make_input("original.bin", data));
  NodeStats after_first = node->stats();

  FileId second = node->put_file(make_input("copy.bin", data));
  NodeStats after_second = node->stats();

  EXPECT_NE(first, second);
  EXPECT_EQ(root->file_registry().lookup(first).chunks, root->file_registry().lookup(second).chunks);

  EXPECT_EQ(after_second.total_files, 2u);
  EXPECT_EQ(after_second.total_file_bytes, 2 * data.size());
  EXPECT_EQ(after_second.chunk_count, after_first.chunk_count);
  EXPECT_EQ(after_second.total_unique_chunk_bytes, data.size());
  EXPECT_NEAR(after_second.dedup_ratio, 0.5, 1e-9);

  std::filesystem::path out = output_dir / "copy.out";
  node->get_file(id_to_string(second), out);
  EXPECT_EQ(read_test_file(out), data);
}

TEST_F(NodeTest, EditedFileSharesMostChunks) {
  auto data = random_bytes(1024 * 1024, 31);
  node->put_file(make_input("v1.bin", data));
  uint64_t chunks_before = node->stats().chunk_count;

  data.insert(data.begin() + 5000, {'e', 'd', 'i', 't'});
  node->put_file(make_input("v2.bin", data));
  uint64_t new_chunks = node->stats().chunk_count - chunks_before;

  EXPECT_LE(new_chunks, 4u);
}

TEST_F(NodeTest, StatsOnEmptyStore) {
  NodeStats stats = node->stats();
  EXPECT_EQ(stats.total_files, 0u);
  EXPECT_EQ(stats.total_file_bytes, 0u);
  EXPECT_EQ(stats.chunk_count, 0u);
  EXPECT_EQ(stats.dedup_ratio, 0.0);
}

TEST_F(NodeTest, ListFiles) {
  node->put_file(make_input("alpha.txt", random_bytes(10, 1)));
  node->put_file(make_input("beta.txt", random_bytes(10, 2)));
  node->put_file(make_input("alphabet.txt", random_bytes(10, 3)));

  EXPECT_EQ(node->list_files().size(), 3u);
  EXPECT_EQ(node->list_files("alpha").size(), 2u);
  EXPECT_TRUE(node->list_files("gamma").empty());
}

TEST_F(NodeTest, PutMissingFileIsNotFound) {
  EXPECT_THROW(node->put_file(input_dir / "does_not_exist.bin"), NotFoundError);
  EXPECT_THROW(node->put_file(input_dir), NotFoundError);
  EXPECT_EQ(node->stats().total_files, 0u);
}

TEST_F(NodeTest, GetUnknownIdIsNotFound) {
  node->put_file(make_input("x.bin", random_bytes(10)));
  EXPECT_THROW(node->get_file("0123456789abcdef0123456789abcdef0", output_dir / "x.out"), NotFoundError);
  EXPECT_THROW(node->get_file("", output_dir / "x.out"), InvalidInputError);
}

TEST_F(NodeTest, GetIntoMissingDirectoryFails) {
  FileId id = node->put_file(make_input("x.bin", random_bytes(10)));
  EXPECT_THROW(node->get_file(id_to_string(id), output_dir / "missing" / "x.out"), IoError);
}

TEST_F(NodeTest, CorruptChunkLeavesNoDestination) {
  auto data = random_bytes(100 * 1024, 55);
  FileId id = node->put_file(make_input("fragile.bin", data));
  FileRecord record = root->file_registry().lookup(id);
  ASSERT_GT(record.chunks.size(), 1u);

  std::string hex = Hasher::to_hex(record.chunks[1]);
  std::filesystem::path chunk_path = test_dir / "store" / "objects" / hex.substr(0, 2) / hex.substr(2);
  auto payload = read_test_file(chunk_path);
  payload[0] ^= 0xFF;
  write_test_file(chunk_path, payload);

  std::filesystem::path out = output_dir / "fragile.out";
  try {
    node->get_file(id_to_string(id), out);
    FAIL() << "Expected CorruptChunkError";
  } catch (const CorruptChunkError& e) {
    EXPECT_EQ(e.subject(), hex);
  }
  EXPECT_FALSE(std::filesystem::exists(out));
  EXPECT_TRUE(std::filesystem::is_empty(output_dir));
}

TEST_F(NodeTest, WholeFileDigestCatchesCorruptionWithoutChunkVerification) {
  auto data = random_bytes(20000, 66);
  FileId id = node->put_file(make_input("unverified.bin", data));
  FileRecord record = root->file_registry().lookup(id);

  open_node(false);

  std::string hex = Hasher::to_hex(record.chunks[0]);
  std::filesystem::path chunk_path = test_dir / "store" / "objects" / hex.substr(0, 2) / hex.substr(2);
  auto payload = read_test_file(chunk_path);
  payload[0] ^= 0xFF;
  write_test_file(chunk_path, payload);

  std::filesystem::path out = output_dir / "unverified.out";
  EXPECT_THROW(node->get_file(id_to_string(id), out), CorruptChunkError);
  EXPECT_FALSE(std::filesystem::exists(out));
}

TEST_F(NodeTest, FilesSurviveRestart) {
  auto data = random_bytes(40000, 12);
  FileId id = node->put_file(make_input("durable.bin", data));
  std::string node_id = root->node_id();

  open_node();
  EXPECT_EQ(root->node_id(), node_id);

  std::filesystem::path out = output_dir / "durable.out";
  node->get_file(id_to_string(id), out);
  EXPECT_EQ(read_test_file(out), data);
}

TEST_F(NodeTest, InvalidChunkerProfileIsRejected) {
  ChunkerConfig config;
  config.max_size = 100;
  EXPECT_THROW(Node(*root, config), InvalidInputError);
}
