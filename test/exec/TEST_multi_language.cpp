#include <filesystem>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "exec/fakes.hpp"
#include "xrun/exec/multi_language.hpp"

namespace xrun::exec::test {

class MultiLanguageTest : public ::testing::Test {
protected:
  void SetUp() override {
    checker_ = std::make_shared<ScriptedRunner>();
    runner_ = std::make_shared<ScriptedRunner>();
  }

  void TearDown() override {
    executor_.reset();
    runner_.reset();
    checker_.reset();
  }

  // Every version check exits with check_exit.
  void make_executor(int check_exit) {
    checker_->handler_ = [check_exit](process::RunRequest const&) -> core::Result<process::RunOutcome> {
      return exited(check_exit);
    };

    auto scanner = security::Scanner::compile(security::policy_for_level(security::SecurityLevel::Moderate));
    ASSERT_TRUE(scanner.has_value());

    auto registry = std::make_shared<runtime::LanguageRuntimeRegistry>(checker_);
    executor_     = std::make_unique<MultiLanguageExecutor>(*std::move(scanner), runner_, registry, BackendOptions{});
  }

  std::shared_ptr<ScriptedRunner>        checker_;
  std::shared_ptr<ScriptedRunner>        runner_;
  std::unique_ptr<MultiLanguageExecutor> executor_;
};

TEST_F(MultiLanguageTest, MissingRuntimeFailsBeforeRunning) {
  make_executor(127);

  auto result = executor_->execute(CodeBlock{"print(1)", runtime::Language::Python, {}}, std::nullopt);

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  ASSERT_TRUE(result.error_message_.has_value());
  EXPECT_NE(result.error_message_->find("not available"), std::string::npos);
  EXPECT_TRUE(runner_->requests_.empty());
}

TEST_F(MultiLanguageTest, UnsafeSnippetIsRefusedBeforeVersionChecks) {
  make_executor(0);

  auto result =
      executor_->execute(CodeBlock{"import os\nos.system('ls')", runtime::Language::Python, {}}, std::nullopt);

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  EXPECT_TRUE(is_security_refusal(result));
  EXPECT_TRUE(runner_->requests_.empty());
  EXPECT_TRUE(checker_->requests_.empty());

  auto stats = executor_->statistics();
  EXPECT_EQ(stats.total_executions_, 1u);
  EXPECT_EQ(stats.security_violations_, 1u);
}

TEST_F(MultiLanguageTest, CompileErrorSkipsTheRun) {
  make_executor(0);

  std::filesystem::path work_dir;
  runner_->handler_ = [&work_dir](process::RunRequest const& request) -> core::Result<process::RunOutcome> {
    work_dir = request.work_dir_;
    return exited(1, "", "main.cpp:1:26: error: expected ';' before '}' token");
  };

  auto result = executor_->execute(CodeBlock{"int main() { return 0 }", runtime::Language::Cpp, {}}, std::nullopt);

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  EXPECT_EQ(result.return_code_, 1);
  EXPECT_EQ(result.stderr_, "main.cpp:1:26: error: expected ';' before '}' token");
  EXPECT_EQ(result.error_message_, "Compilation failed with exit code 1");

  ASSERT_EQ(runner_->requests_.size(), 1u);
  EXPECT_EQ(runner_->requests_[0].argv_.front(), "g++");
  EXPECT_FALSE(std::filesystem::exists(work_dir));
}

TEST_F(MultiLanguageTest, InstalledRuntimeRuns) {
  make_executor(0);
  runner_->push(exited(0, "1\n"));

  auto result = executor_->execute(CodeBlock{"print(1)", runtime::Language::Python, {}}, std::nullopt);

  EXPECT_EQ(result.status_, ExecutionStatus::Completed);
  EXPECT_EQ(result.stdout_, "1\n");
  ASSERT_EQ(runner_->requests_.size(), 1u);
  EXPECT_EQ(runner_->requests_[0].argv_.front(), "python3");
  EXPECT_EQ(executor_->kind(), BackendKind::Native);
}

TEST_F(MultiLanguageTest, CleanupStopsRunner) {
  make_executor(0);
  executor_->cleanup();
  EXPECT_EQ(runner_->terminate_calls_, 1);
}

} // namespace xrun::exec::test
