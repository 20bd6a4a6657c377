#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "exec/fakes.hpp"
#include "xrun/exec/sandbox_client.hpp"

namespace xrun::exec::test {

namespace {

auto read_text(std::filesystem::path const& path) -> std::string {
  std::ifstream in(path);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Contents of the file named by "@path" after the given flag.
auto file_argument(std::vector<std::string> const& argv, std::string const& flag) -> std::string {
  auto it = std::find(argv.begin(), argv.end(), flag);
  if (it == argv.end() || std::next(it) == argv.end() || !std::next(it)->starts_with("@")) {
    return {};
  }
  return read_text(std::next(it)->substr(1));
}

} // namespace

class SandboxClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    runner_ = std::make_shared<ScriptedRunner>();
    client_ = std::make_unique<CurlGatewayClient>(
        runner_, GatewayEndpoint{.url_ = "https://gw.example/", .api_key_ = "s3cret-key"}, "curl"
    );
  }

  void TearDown() override {
    client_.reset();
    runner_.reset();
  }

  std::shared_ptr<ScriptedRunner>    runner_;
  std::unique_ptr<CurlGatewayClient> client_;
};

TEST_F(SandboxClientTest, SplitsStatusFromBody) {
  auto split = split_http_status("{\"id\":\"a\"}\n201");
  ASSERT_TRUE(split.has_value());
  EXPECT_EQ(split->first, "{\"id\":\"a\"}");
  EXPECT_EQ(split->second, 201);

  auto empty = split_http_status("\n204");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->first.empty());
  EXPECT_EQ(empty->second, 204);
}

TEST_F(SandboxClientTest, RejectsMissingStatus) {
  EXPECT_FALSE(split_http_status("no status here").has_value());
  EXPECT_FALSE(split_http_status("body\nabc").has_value());
}

TEST_F(SandboxClientTest, KeyStaysOffTheCommandLine) {
  std::string headers;
  std::string body;
  runner_->handler_ = [&](process::RunRequest const& request) -> core::Result<process::RunOutcome> {
    for (auto const& arg : request.argv_) {
      EXPECT_EQ(arg.find("s3cret-key"), std::string::npos) << arg;
    }
    headers = file_argument(request.argv_, "-H");
    body    = file_argument(request.argv_, "--data-binary");
    return exited(0, "{\"id\":\"sb-1\"}\n201");
  };

  SessionSpec spec;
  spec.template_  = "default";
  spec.memory_mb_ = 256;

  auto session = client_->create_session(spec);
  ASSERT_TRUE(session.has_value()) << session.error();
  EXPECT_EQ(*session, "sb-1");

  EXPECT_NE(headers.find("Authorization: Bearer s3cret-key"), std::string::npos);

  auto document = nlohmann::json::parse(body);
  EXPECT_EQ(document["template"], "default");
  EXPECT_EQ(document["memory_mb"], 256);
  EXPECT_EQ(document["network"], false);

  ASSERT_EQ(runner_->requests_.size(), 1u);
  auto const& argv = runner_->requests_[0].argv_;
  EXPECT_EQ(argv.front(), "curl");
  EXPECT_EQ(argv.back(), "https://gw.example/sandboxes");
  EXPECT_FALSE(std::filesystem::exists(runner_->requests_[0].work_dir_));
}

TEST_F(SandboxClientTest, CommandResultIsDecoded) {
  runner_->push(exited(0, "{\"stdout\":\"hi\\n\",\"stderr\":\"\",\"exit_code\":3,\"timed_out\":false}\n200"));

  RemoteCommand command;
  command.argv_ = {"python3", "/workspace/main.py"};
  command.cwd_  = "/workspace";

  auto outcome = client_->run("sb-1", command);
  ASSERT_TRUE(outcome.has_value()) << outcome.error();
  EXPECT_EQ(outcome->stdout_, "hi\n");
  EXPECT_EQ(outcome->exit_code_, 3);
  EXPECT_FALSE(outcome->timed_out_);
  EXPECT_EQ(runner_->requests_[0].argv_.back(), "https://gw.example/sandboxes/sb-1/commands");
}

TEST_F(SandboxClientTest, HttpErrorsAreReported) {
  runner_->push(exited(0, "{\"error\":\"gone\"}\n404"));

  auto uploaded = client_->upload("sb-1", "/workspace/main.py", "print(1)");
  ASSERT_FALSE(uploaded.has_value());
  EXPECT_EQ(uploaded.error(), "gateway returned HTTP 404 for PUT /sandboxes/sb-1/files");
}

TEST_F(SandboxClientTest, CurlFailureIsReported) {
  runner_->push(exited(6, "", "curl: (6) Could not resolve host\n"));

  auto destroyed = client_->destroy_session("sb-1");
  ASSERT_FALSE(destroyed.has_value());
  EXPECT_EQ(destroyed.error(), "curl exited with code 6: curl: (6) Could not resolve host");
}

TEST_F(SandboxClientTest, MissingSessionIdIsAnError) {
  runner_->push(exited(0, "{}\n201"));
  EXPECT_FALSE(client_->create_session(SessionSpec{}).has_value());
}

TEST_F(SandboxClientTest, ReachabilityIsCheckedOnce) {
  runner_->push_error("failed to execute curl: No such file or directory");

  EXPECT_FALSE(client_->reachable());
  EXPECT_FALSE(client_->reachable());
  ASSERT_EQ(runner_->requests_.size(), 1u);
  EXPECT_EQ(runner_->requests_[0].argv_, (std::vector<std::string>{"curl", "--version"}));
}

} // namespace xrun::exec::test
