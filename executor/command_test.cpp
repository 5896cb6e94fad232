#include "executor/command.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

// NOLINTNEXTLINE
TEST(Command, ParseAction) {
  EXPECT_EQ(executor::ParseAction("createFile"), proto::CREATE_FILE);
  EXPECT_EQ(executor::ParseAction("create_file"), proto::CREATE_FILE);
  EXPECT_EQ(executor::ParseAction("install_pip"), proto::INSTALL_PACKAGE);
  EXPECT_EQ(executor::ParseAction("execute"), proto::EXECUTE_FILE);
  EXPECT_EQ(executor::ParseAction("list_executor_dir"),
            proto::LIST_EXECUTOR_TREE);
  EXPECT_EQ(executor::ParseAction("CreateFile"), proto::UNKNOWN_ACTION);
  EXPECT_EQ(executor::ParseAction("rm -rf"), proto::UNKNOWN_ACTION);
}

// NOLINTNEXTLINE
TEST(Command, DecodeUpdateFile) {
  nlohmann::json document = {{"action", "updateFile"},
                             {"file", "a.txt"},
                             {"range", "2-3"},
                             {"content", "X\nY"},
                             {"ignored", 42}};
  proto::Command command =
      executor::DecodeCommand("c1.json", proto::UPDATE_FILE, document);
  EXPECT_EQ(command.id(), "c1.json");
  ASSERT_TRUE(command.has_update_file());
  EXPECT_EQ(command.update_file().file(), "a.txt");
  EXPECT_EQ(command.update_file().range(), "2-3");
  EXPECT_EQ(command.update_file().content(), "X\nY");
}

// NOLINTNEXTLINE
TEST(Command, DecodeOptionalDefaults) {
  nlohmann::json document = {{"file", "a.txt"}, {"range", "append"}};
  proto::Command command =
      executor::DecodeCommand("c", proto::UPDATE_FILE, document);
  EXPECT_EQ(command.update_file().content(), "");

  command = executor::DecodeCommand("c", proto::READ_FILE, {{"file", "a"}});
  EXPECT_FALSE(command.read_file().has_range());
  command = executor::DecodeCommand("c", proto::READ_FILE,
                                    {{"file", "a"}, {"range", "1-2"}});
  EXPECT_TRUE(command.read_file().has_range());
  EXPECT_EQ(command.read_file().range(), "1-2");
}

// NOLINTNEXTLINE
TEST(Command, DecodeMissingParameter) {
  EXPECT_THROW(executor::DecodeCommand(  // NOLINT
                   "c", proto::UPDATE_FILE, {{"file", "a.txt"}}),
               executor::missing_parameter);
  EXPECT_THROW(executor::DecodeCommand(  // NOLINT
                   "c", proto::INSTALL_PACKAGE, {{"package", 3}}),
               executor::missing_parameter);
  try {
    executor::DecodeCommand("c", proto::DELETE_FILE, {{"action", "x"}});
    FAIL() << "no exception";
  } catch (const executor::missing_parameter& e) {
    EXPECT_THAT(e.what(), HasSubstr("'file'"));
  }
}

// NOLINTNEXTLINE
TEST(Command, DecodeWrongOptionalType) {
  EXPECT_THROW(executor::DecodeCommand(  // NOLINT
                   "c", proto::CREATE_FILE,
                   {{"file", "a.txt"}, {"content", {1, 2}}}),
               std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(Command, DecodeArgsString) {
  proto::Command command = executor::DecodeCommand(
      "c", proto::EXECUTE_FILE, {{"file", "s.py"}, {"args", " -v\tx  y\n"}});
  EXPECT_THAT(command.execute_file().args(), ElementsAre("-v", "x", "y"));
}

// NOLINTNEXTLINE
TEST(Command, DecodeArgsList) {
  proto::Command command = executor::DecodeCommand(
      "c", proto::EXECUTE_FILE,
      {{"file", "s.py"}, {"args", {"with space", "two"}}});
  EXPECT_THAT(command.execute_file().args(), ElementsAre("with space", "two"));
}

// NOLINTNEXTLINE
TEST(Command, DecodeNoArgs) {
  proto::Command command =
      executor::DecodeCommand("c", proto::EXECUTE_FILE, {{"file", "s.py"}});
  EXPECT_THAT(command.execute_file().args(), IsEmpty());
}

// NOLINTNEXTLINE
TEST(Command, EncodeResult) {
  proto::Result result;
  result.set_id("c.json");
  result.set_success(true);
  result.set_stdout_text("out");
  result.set_stderr_text("");
  result.set_exit_code(3);
  result.set_signal(0);
  nlohmann::json document =
      nlohmann::json::parse(executor::EncodeResult(result));
  EXPECT_EQ(document, nlohmann::json({{"success", true},
                                      {"stdout", "out"},
                                      {"stderr", ""},
                                      {"exit_code", 3},
                                      {"signal", 0}}));
}

// NOLINTNEXTLINE
TEST(Command, EncodeFiles) {
  proto::Result result;
  result.set_success(true);
  result.mutable_files()->add_names("a.txt");
  result.mutable_files()->add_names("dir/b.py");
  nlohmann::json document =
      nlohmann::json::parse(executor::EncodeResult(result));
  EXPECT_EQ(document["files"], nlohmann::json({"a.txt", "dir/b.py"}));
}

// NOLINTNEXTLINE
TEST(Command, EncodeEmptyFiles) {
  proto::Result result;
  result.set_success(true);
  result.mutable_files();
  nlohmann::json document =
      nlohmann::json::parse(executor::EncodeResult(result));
  ASSERT_TRUE(document.contains("files"));
  EXPECT_TRUE(document["files"].is_array());
  EXPECT_TRUE(document["files"].empty());
}

// NOLINTNEXTLINE
TEST(Command, EncodeInvalidUtf8) {
  proto::Result result;
  result.set_success(false);
  result.set_error("bad \xff byte");
  nlohmann::json document =
      nlohmann::json::parse(executor::EncodeResult(result));
  EXPECT_FALSE(document["success"].get<bool>());
  EXPECT_THAT(document["error"].get<std::string>(), HasSubstr("byte"));
}

}  // namespace
