#include <gtest/gtest.h>
#include "ethstorage/blob/blob.hpp"
#include "ethstorage/directory/flat_directory.hpp"
#include "fakes.hpp"

using namespace ethstorage;
using namespace ethstorage::directory;

class FlatDirectoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::quiet_logging();
    stats = std::make_shared<test::BackendStats>();
    config.rpc = "http://localhost:8545";
    config.ethstorage_rpc = "http://localhost:9540";
    config.private_key = std::string(64, '3');
    config.address = "0x00000000000000000000000000000000000000d1";
    config.upload_concurrency = 2;
    config.download_concurrency = 2;
  }

  std::unique_ptr<FlatDirectory> make_directory() {
    return FlatDirectory::create(config, binding, test::fake_backend_factory(stats));
  }

  upload::UploadCallback finish_counter(int& finishes, std::vector<std::string>& failures) {
    upload::UploadCallback callback;
    callback.on_fail = [&failures](const std::string& error) { failures.push_back(error); };
    callback.on_finish = [&finishes](const upload::UploadResult&) { ++finishes; };
    return callback;
  }

  std::shared_ptr<test::BackendStats> stats;
  test::FakeBinding binding;
  config::SdkConfig config;
};

//==============================================
// CONSTRUCTION
//==============================================

TEST_F(FlatDirectoryTest, CreateChecksVersionAndBlobSupport) {
  binding.directory_writer->blob_supported = false;
  auto directory = make_directory();
  EXPECT_FALSE(directory->blob_supported());
  EXPECT_FALSE(directory->read_only());
  EXPECT_EQ(*directory->address(), *config.address);
}

TEST_F(FlatDirectoryTest, RejectsUnsupportedContractVersion) {
  binding.directory_writer->version = "0.9.0";
  EXPECT_THROW(make_directory(), CapabilityError);
}

TEST_F(FlatDirectoryTest, ReadOnlyNeedsReaderEndpoint) {
  config.private_key.reset();
  config.ethstorage_rpc.reset();
  EXPECT_THROW(make_directory(), ValidationError);

  config.ethstorage_rpc = "http://localhost:9540";
  auto directory = make_directory();
  EXPECT_TRUE(directory->read_only());
}

//==============================================
// FILE OPERATIONS
//==============================================

TEST_F(FlatDirectoryTest, UploadThenDownload) {
  auto directory = make_directory();
  int finishes = 0;
  std::vector<std::string> failures;

  upload::UploadRequest request;
  request.key = "index.html";
  request.content = test::make_content(1000);
  upload::UploadOutcome outcome = directory->upload(request, finish_counter(finishes, failures));
  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(finishes, 1);
  EXPECT_TRUE(failures.empty());
  EXPECT_EQ(binding.signer->sent_snapshot().size(), 1u);

  test::FakeStorageContract::File stored;
  stored.chunks = {test::to_bytes("<html>"), test::to_bytes("</html>")};
  stored.hashes.resize(2);
  binding.directory_reader->put_file("index.html", stored);

  Bytes content;
  download::DownloadCallback callback;
  callback.on_progress = [&content](uint64_t, uint64_t, const Bytes& data) {
    content.insert(content.end(), data.begin(), data.end());
  };
  EXPECT_TRUE(directory->download("index.html", callback));
  EXPECT_EQ(test::to_text(content), "<html></html>");
}

TEST_F(FlatDirectoryTest, ConfiguredGasIncreaseAndNonceModeApply) {
  config.gas_increase_pct = 50;
  config.confirm_nonce = true;
  auto directory = make_directory();
  int finishes = 0;
  std::vector<std::string> failures;

  upload::UploadRequest request;
  request.key = "a.txt";
  request.content = test::make_content(100);
  directory->upload(request, finish_counter(finishes, failures));

  auto sent = binding.signer->sent_snapshot();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(*sent[0].max_fee_per_gas, Wei(150));
}

TEST_F(FlatDirectoryTest, ReadOnlyUploadFailsThroughCallback) {
  config.private_key.reset();
  auto directory = make_directory();
  int finishes = 0;
  std::vector<std::string> failures;

  upload::UploadRequest request;
  request.key = "a.txt";
  request.content = test::make_content(100);
  upload::UploadOutcome outcome = directory->upload(request, finish_counter(finishes, failures));

  EXPECT_FALSE(outcome.ok());
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0], "Validation error: private key is required for this operation");
  EXPECT_EQ(finishes, 1);
}

TEST_F(FlatDirectoryTest, DownloadNeedsReaderEndpoint) {
  config.ethstorage_rpc.reset();
  auto directory = make_directory();
  EXPECT_THROW(directory->download("a.txt", download::DownloadCallback()), ValidationError);
}

TEST_F(FlatDirectoryTest, EstimateUsesConfiguredIncrease) {
  config.gas_increase_pct = 10;
  auto directory = make_directory();
  upload::EstimateRequest request;
  request.key = "a.txt";
  request.content = test::make_content(100);

  CostEstimate estimate = directory->estimate_cost(request);
  Wei base = Wei(110) * 110000 + Wei(1) * blob::BLOB_SIZE;
  EXPECT_EQ(estimate.gas_cost, Wei(base + base / 10));
  EXPECT_EQ(estimate.storage_cost, binding.directory_writer->cost_per_chunk);
}

TEST_F(FlatDirectoryTest, FetchHashesForSeveralKeys) {
  auto directory = make_directory();
  test::FakeStorageContract::File file;
  file.hashes = {Hash32{}, Hash32{}};
  file.hashes[1][0] = 0x99;
  binding.directory_writer->put_file("a", file);

  auto hashes = directory->fetch_hashes({"a", "b"});
  ASSERT_EQ(hashes["a"].size(), 2u);
  EXPECT_EQ(hashes["a"][1][0], 0x99);
  EXPECT_TRUE(hashes["b"].empty());
}

TEST_F(FlatDirectoryTest, ManagementTransactions) {
  auto directory = make_directory();
  EXPECT_TRUE(directory->remove("old.txt"));
  EXPECT_TRUE(directory->set_default("index.html"));
  EXPECT_EQ(binding.directory_writer->calls_snapshot(),
            (std::vector<std::string>{"remove:old.txt", "setDefault:index.html"}));

  binding.signer->fail_hash("0xtx2");
  EXPECT_FALSE(directory->remove("other.txt"));
  EXPECT_THROW(directory->remove(""), ValidationError);
}

TEST_F(FlatDirectoryTest, ManagementNeedsDeployedDirectory) {
  config.address.reset();
  auto directory = make_directory();
  EXPECT_THROW(directory->remove("a"), ValidationError);
  EXPECT_THROW(directory->set_default("a"), ValidationError);
}

TEST_F(FlatDirectoryTest, CloseReleasesBackend) {
  auto directory = make_directory();
  upload::UploadRequest request;
  request.key = "a.txt";
  request.content = test::make_content(100);
  directory->upload(request, upload::UploadCallback());
  directory->close();
  directory.reset();
  EXPECT_EQ(stats->released.load(), 1);
}
