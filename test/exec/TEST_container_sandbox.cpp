#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "exec/fakes.hpp"
#include "xrun/exec/container_sandbox.hpp"

namespace xrun::exec::test {

namespace {

auto contains_pair(std::vector<std::string> const& argv, std::string const& flag, std::string const& value) -> bool {
  for (std::size_t i = 0; i + 1 < argv.size(); ++i) {
    if (argv[i] == flag && argv[i + 1] == value) {
      return true;
    }
  }
  return false;
}

auto contains(std::vector<std::string> const& argv, std::string const& value) -> bool {
  return std::find(argv.begin(), argv.end(), value) != argv.end();
}

} // namespace

class ContainerSandboxTest : public ::testing::Test {
protected:
  void SetUp() override {
    runner_ = std::make_shared<ScriptedRunner>();
  }

  void TearDown() override {
    runner_.reset();
  }

  auto make_sandbox(security::SecurityLevel level, ContainerSettings settings = {})
      -> std::unique_ptr<ContainerSandbox> {
    auto scanner = security::Scanner::compile(security::policy_for_level(level));
    EXPECT_TRUE(scanner.has_value());
    return std::make_unique<ContainerSandbox>(*std::move(scanner), runner_, std::move(settings), BackendOptions{});
  }

  std::shared_ptr<ScriptedRunner> runner_;
};

TEST_F(ContainerSandboxTest, StrictFlags) {
  auto flags = container_run_flags(security::policy_for_level(security::SecurityLevel::Strict), 1000, 100);

  EXPECT_TRUE(contains_pair(flags, "--network", "none"));
  EXPECT_TRUE(contains_pair(flags, "--memory", "256m"));
  EXPECT_TRUE(contains_pair(flags, "--memory-swap", "256m"));
  EXPECT_TRUE(contains_pair(flags, "--cpus", "0.5"));
  EXPECT_TRUE(contains_pair(flags, "--pids-limit", "2"));
  EXPECT_TRUE(contains_pair(flags, "--security-opt", "no-new-privileges"));
  EXPECT_TRUE(contains_pair(flags, "--user", "1000:100"));
  EXPECT_TRUE(contains_pair(flags, "--cap-drop", "ALL"));
  EXPECT_TRUE(contains(flags, "--read-only"));
  EXPECT_TRUE(contains_pair(flags, "--tmpfs", "/tmp:rw,noexec,nosuid,size=64m"));
}

TEST_F(ContainerSandboxTest, ModerateFlags) {
  auto flags = container_run_flags(security::policy_for_level(security::SecurityLevel::Moderate), 0, 0);

  EXPECT_TRUE(contains_pair(flags, "--network", "none"));
  EXPECT_TRUE(contains_pair(flags, "--cap-drop", "ALL"));
  EXPECT_FALSE(contains(flags, "--read-only"));
}

TEST_F(ContainerSandboxTest, PermissiveFlags) {
  auto flags = container_run_flags(security::policy_for_level(security::SecurityLevel::Permissive), 0, 0);

  EXPECT_TRUE(contains_pair(flags, "--network", "bridge"));
  EXPECT_TRUE(contains_pair(flags, "--memory", "1024m"));
  EXPECT_TRUE(contains_pair(flags, "--cpus", "2"));
  EXPECT_TRUE(contains_pair(flags, "--pids-limit", "10"));
  EXPECT_TRUE(contains_pair(flags, "--cap-drop", "SYS_ADMIN"));
  EXPECT_TRUE(contains_pair(flags, "--cap-drop", "SYS_MODULE"));
  EXPECT_FALSE(contains_pair(flags, "--cap-drop", "ALL"));
  EXPECT_FALSE(contains(flags, "--read-only"));
}

TEST_F(ContainerSandboxTest, CommandLayout) {
  ContainerRunner containers(runner_, "podman", {"--network", "none"});

  process::RunRequest request;
  request.argv_     = {"python3", "/workspace/main.py"};
  request.work_dir_ = "/tmp/job";

  auto argv = containers.command_for("box", "python:3.11-slim", request);
  EXPECT_EQ(
      argv,
      (std::vector<std::string>{
          "podman", "run", "--rm", "--name", "box", "-v", "/tmp/job:/workspace", "-w", "/workspace", "--network",
          "none", "python:3.11-slim", "python3", "/workspace/main.py"
      })
  );
}

TEST_F(ContainerSandboxTest, ClientRunsWithHostEnvironment) {
  ContainerRunner containers(runner_, "docker", {});

  process::RunRequest request;
  request.argv_                  = {"true"};
  request.work_dir_              = "/tmp/job";
  request.env_                   = core::env::Environment{{"PATH", "/usr/bin"}};
  request.limits_.max_processes_ = 2;

  auto outcome = containers.run("alpine", request);
  ASSERT_TRUE(outcome.has_value());

  ASSERT_EQ(runner_->requests_.size(), 1u);
  auto const& outer = runner_->requests_[0];
  EXPECT_EQ(outer.argv_.front(), "docker");
  EXPECT_FALSE(outer.env_.has_value());
  EXPECT_FALSE(outer.limits_.max_processes_.has_value());
}

TEST_F(ContainerSandboxTest, TimedOutContainerIsKilled) {
  runner_->push(timed_out());
  ContainerRunner containers(runner_, "docker", {});

  process::RunRequest request;
  request.argv_     = {"sleep", "100"};
  request.work_dir_ = "/tmp/job";

  auto outcome = containers.run("alpine", request);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->timed_out_);

  ASSERT_EQ(runner_->requests_.size(), 2u);
  auto const& run_argv = runner_->requests_[0].argv_;
  auto        name     = std::find(run_argv.begin(), run_argv.end(), "--name");
  ASSERT_NE(name, run_argv.end());
  EXPECT_EQ(runner_->requests_[1].argv_, (std::vector<std::string>{"docker", "kill", *(name + 1)}));
}

TEST_F(ContainerSandboxTest, AvailabilityIsCheckedOnce) {
  auto sandbox = make_sandbox(security::SecurityLevel::Moderate);

  EXPECT_TRUE(sandbox->is_available());
  EXPECT_TRUE(sandbox->is_available());

  ASSERT_EQ(runner_->requests_.size(), 1u);
  EXPECT_EQ(runner_->requests_[0].argv_, (std::vector<std::string>{"docker", "version"}));
}

TEST_F(ContainerSandboxTest, MissingRuntimeIsUnavailable) {
  runner_->push_error("failed to execute docker: No such file or directory");
  auto sandbox = make_sandbox(security::SecurityLevel::Moderate);

  EXPECT_FALSE(sandbox->is_available());
}

TEST_F(ContainerSandboxTest, SnippetRunsInImage) {
  runner_->push(exited(0, "hello\n"));
  auto sandbox = make_sandbox(security::SecurityLevel::Moderate);

  auto result = sandbox->execute(CodeBlock{"print('hello')", runtime::Language::Python, {}}, std::nullopt);

  EXPECT_EQ(result.status_, ExecutionStatus::Completed);
  EXPECT_EQ(result.stdout_, "hello\n");

  ASSERT_EQ(runner_->requests_.size(), 1u);
  auto const& argv = runner_->requests_[0].argv_;
  ASSERT_GE(argv.size(), 3u);
  EXPECT_EQ(argv[argv.size() - 3], "python:3.11-slim");
  EXPECT_EQ(argv[argv.size() - 2], "python3");
  EXPECT_EQ(argv[argv.size() - 1], "/workspace/main.py");
  EXPECT_TRUE(contains_pair(argv, "-w", "/workspace"));
}

TEST_F(ContainerSandboxTest, KilledContainerReportsMemoryLimit) {
  runner_->push(exited(137));
  auto sandbox = make_sandbox(security::SecurityLevel::Moderate);

  auto result = sandbox->execute(CodeBlock{"x = [0] * 10**10", runtime::Language::Python, {}}, std::nullopt);

  EXPECT_EQ(result.status_, ExecutionStatus::MemoryLimit);
  EXPECT_EQ(result.return_code_, 137);
  EXPECT_EQ(result.error_message_, "Container exceeded the 512 MB memory limit");
}

TEST_F(ContainerSandboxTest, UnsafeSnippetNeverStartsContainer) {
  auto sandbox = make_sandbox(security::SecurityLevel::Moderate);

  auto result = sandbox->execute(CodeBlock{"import subprocess", runtime::Language::Python, {}}, std::nullopt);

  EXPECT_TRUE(is_security_refusal(result));
  EXPECT_TRUE(runner_->requests_.empty());
  EXPECT_EQ(sandbox->statistics().security_violations_, 1u);
}

TEST_F(ContainerSandboxTest, ImagesCanBeOverridden) {
  ContainerSettings settings;
  settings.images_[runtime::Language::Python] = "registry.local/python:3.12";
  auto sandbox = make_sandbox(security::SecurityLevel::Moderate, settings);

  EXPECT_EQ(sandbox->image_for(runtime::Language::Python), "registry.local/python:3.12");
  EXPECT_EQ(sandbox->image_for(runtime::Language::Cpp), "gcc:13");
}

TEST_F(ContainerSandboxTest, CleanupStopsRunner) {
  auto sandbox = make_sandbox(security::SecurityLevel::Moderate);
  sandbox->cleanup();
  EXPECT_EQ(runner_->terminate_calls_, 1);
}

} // namespace xrun::exec::test
