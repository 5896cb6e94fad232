#include "executor/poller.hpp"
#include <stdexcept>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "store/local_queue_store.hpp"
#include "util/file.hpp"

namespace {

using ::testing::_;
using ::testing::AtLeast;
using ::testing::Return;
using ::testing::Throw;

const std::string test_tmpdir = "/tmp/task_relay_testdir";

class MockQueueStore : public store::QueueStore {
 public:
  MOCK_METHOD(proto::StoreResponse, ReadFile,
              (proto::Collection collection, const std::string& filename),
              (override));
  MOCK_METHOD(proto::StoreResponse, SaveFile,
              (proto::Collection collection, const std::string& filename,
               const std::string& content),
              (override));
  MOCK_METHOD(proto::StoreResponse, DeleteFile,
              (proto::Collection collection, const std::string& filename),
              (override));
  MOCK_METHOD(proto::StoreResponse, ListFiles, (proto::Collection collection),
              (override));
};

proto::StoreResponse Listing(std::initializer_list<const char*> names) {
  proto::StoreResponse response;
  response.set_success(true);
  for (const char* name : names) response.add_files(name);
  return response;
}

proto::StoreResponse Document(const std::string& content) {
  proto::StoreResponse response;
  response.set_success(true);
  response.set_content(content);
  return response;
}

class PollerTest : public ::testing::Test {
 protected:
  PollerTest() : tmp_(test_tmpdir + "/poller") {
    config_.sandbox_root = util::File::JoinPath(tmp_.Path(), "project");
    config_.temp_directory = util::File::JoinPath(tmp_.Path(), "temp");
    util::File::MakeDirs(config_.sandbox_root);
    context_.config = &config_;
  }

  util::TempDir tmp_;
  executor::Config config_;
  executor::ActionContext context_;
};

// NOLINTNEXTLINE
TEST_F(PollerTest, ProcessesEveryCommand) {
  store::LocalQueueStore queue(util::File::JoinPath(tmp_.Path(), "storage"));
  queue.SaveFile(proto::COMMAND, "1.json",
                 R"({"action": "createFile", "file": "one.txt"})");
  queue.SaveFile(proto::COMMAND, "2.json",
                 R"({"action": "createFile", "file": "two.txt"})");
  executor::Dispatcher dispatcher(&queue, context_);
  executor::Poller poller(&queue, &dispatcher, std::chrono::milliseconds(10));

  EXPECT_EQ(poller.PollOnce(), 2u);
  EXPECT_TRUE(queue.ListFiles(proto::COMMAND).files().empty());
  EXPECT_EQ(queue.ListFiles(proto::RESULT).files_size(), 2);
  EXPECT_EQ(util::File::ListTree(config_.sandbox_root),
            std::vector<std::string>({"one.txt", "two.txt"}));
  EXPECT_EQ(poller.PollOnce(), 0u);
}

// NOLINTNEXTLINE
TEST_F(PollerTest, ListTransportError) {
  MockQueueStore queue;
  EXPECT_CALL(queue, ListFiles(proto::COMMAND))
      .WillOnce(Throw(store::transport_error("unavailable")));
  EXPECT_CALL(queue, ReadFile(_, _)).Times(0);
  executor::Dispatcher dispatcher(&queue, context_);
  executor::Poller poller(&queue, &dispatcher, std::chrono::milliseconds(10));
  EXPECT_EQ(poller.PollOnce(), 0u);
}

// NOLINTNEXTLINE
TEST_F(PollerTest, ListRefused) {
  MockQueueStore queue;
  proto::StoreResponse refused;
  refused.set_success(false);
  refused.set_error("Unknown file type");
  EXPECT_CALL(queue, ListFiles(proto::COMMAND)).WillOnce(Return(refused));
  EXPECT_CALL(queue, ReadFile(_, _)).Times(0);
  executor::Dispatcher dispatcher(&queue, context_);
  executor::Poller poller(&queue, &dispatcher, std::chrono::milliseconds(10));
  EXPECT_EQ(poller.PollOnce(), 0u);
}

// NOLINTNEXTLINE
TEST_F(PollerTest, FailureDoesNotStopOtherCommands) {
  MockQueueStore queue;
  EXPECT_CALL(queue, ListFiles(proto::COMMAND))
      .WillOnce(Return(Listing({"bad.json", "good.json"})));
  EXPECT_CALL(queue, ReadFile(proto::COMMAND, "bad.json"))
      .WillOnce(Throw(std::runtime_error("corrupted response")));
  EXPECT_CALL(queue, ReadFile(proto::COMMAND, "good.json"))
      .WillOnce(Return(Document(R"({"action": "fly"})")));
  EXPECT_CALL(queue, SaveFile(proto::RESULT, "good.json", _))
      .WillOnce(Return(Document("")));
  EXPECT_CALL(queue, DeleteFile(proto::COMMAND, "good.json"))
      .WillOnce(Return(Document("")));
  executor::Dispatcher dispatcher(&queue, context_);
  executor::Poller poller(&queue, &dispatcher, std::chrono::milliseconds(10));
  EXPECT_EQ(poller.PollOnce(), 2u);
}

// NOLINTNEXTLINE
TEST_F(PollerTest, RunUntilStopped) {
  MockQueueStore queue;
  EXPECT_CALL(queue, ListFiles(proto::COMMAND))
      .Times(AtLeast(2))
      .WillRepeatedly(Return(Listing({})));
  executor::Dispatcher dispatcher(&queue, context_);
  executor::Poller poller(&queue, &dispatcher, std::chrono::milliseconds(10));
  std::thread runner([&poller]() { poller.Run(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  poller.Stop();
  runner.join();
}

}  // namespace
