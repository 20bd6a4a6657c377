#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "xrun/core/env.hpp"
#include "xrun/exec/engine.hpp"

namespace xrun::exec::test {

using namespace std::chrono_literals;

class EngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    options_.mode_                   = "sandbox";
    options_.backend_.work_dir_      = std::filesystem::temp_directory_path();
    options_.backend_.inherited_env_ = core::env::snapshot();
  }

  void TearDown() override {
    engine_.reset();
  }

  void start(security::SecurityLevel level, BackendBuilder builder = {}) {
    auto engine = Engine::create(security::policy_for_level(level), options_, std::move(builder));
    ASSERT_TRUE(engine.has_value()) << engine.error();
    engine_ = std::move(*engine);
  }

  [[nodiscard]] auto has_runtime(runtime::Language language) const -> bool {
    return engine_->factory()->registry()->is_available(language);
  }

  FactoryOptions          options_;
  std::unique_ptr<Engine> engine_;
};

TEST_F(EngineTest, PrintsGreeting) {
  start(security::SecurityLevel::Moderate);
  if (!has_runtime(runtime::Language::Python)) {
    GTEST_SKIP() << "python3 not installed";
  }

  auto result = engine_->execute("print('hi')", "python", 5s);

  EXPECT_EQ(result.status_, ExecutionStatus::Completed) << result.error_message_.value_or("");
  EXPECT_NE(result.stdout_.find("hi"), std::string::npos);
  EXPECT_EQ(result.return_code_, 0);
}

TEST_F(EngineTest, EndlessLoopTimesOut) {
  start(security::SecurityLevel::Moderate);
  if (!has_runtime(runtime::Language::Python)) {
    GTEST_SKIP() << "python3 not installed";
  }

  auto result = engine_->execute("while True: pass", "python", 1s);

  EXPECT_EQ(result.status_, ExecutionStatus::Timeout);
  EXPECT_EQ(result.error_message_, "Execution timed out after 1 seconds");
  EXPECT_GE(result.execution_time_sec_, 0.9);
  EXPECT_LT(result.execution_time_sec_, 5.0);
}

TEST_F(EngineTest, StrictRefusesShellOut) {
  start(security::SecurityLevel::Strict);

  auto result = engine_->execute("import os; os.system('ls')", "python");

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  ASSERT_TRUE(result.error_message_.has_value());
  EXPECT_NE(result.error_message_->find("Security check failed"), std::string::npos);
  EXPECT_EQ(engine_->statistics().security_violations_, 1u);
}

TEST_F(EngineTest, StrictRefusesDestructiveCommand) {
  start(security::SecurityLevel::Strict);

  auto result = engine_->run_command("rm -rf /");

  EXPECT_FALSE(result.security_validated_);
  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  EXPECT_EQ(result.command_, "rm -rf /");
}

TEST_F(EngineTest, CompileErrorIsReported) {
  start(security::SecurityLevel::Moderate);
  if (!has_runtime(runtime::Language::Cpp)) {
    GTEST_SKIP() << "g++ not installed";
  }

  auto result = engine_->execute("int main() { return 0 }", "cpp", 30s);

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  EXPECT_FALSE(result.stderr_.empty());
  EXPECT_NE(result.return_code_, 0);
  EXPECT_EQ(result.error_message_->rfind("Compilation failed", 0), 0u);
}

TEST_F(EngineTest, ShellCommandRuns) {
  start(security::SecurityLevel::Moderate);

  auto result = engine_->run_command("echo terminal", 5s);

  EXPECT_EQ(result.status_, ExecutionStatus::Completed);
  EXPECT_EQ(result.stdout_, "terminal\n");
  EXPECT_TRUE(result.security_validated_);
  EXPECT_EQ(engine_->statistics().language_distribution_.at("shell"), 1u);
}

TEST_F(EngineTest, UnknownLanguage) {
  start(security::SecurityLevel::Moderate);

  auto result = engine_->execute("DISPLAY 'HI'.", "cobol");

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  EXPECT_EQ(result.error_message_, "Unsupported language: cobol");
  EXPECT_EQ(engine_->statistics().total_executions_, 1u);
}

TEST_F(EngineTest, BackendFailureBecomesResult) {
  start(security::SecurityLevel::Moderate, [](BackendKind, security::Scanner const&) -> std::unique_ptr<Backend> {
    throw std::runtime_error("no backend today");
  });

  auto result = engine_->execute("print(1)", "python");
  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  EXPECT_EQ(result.error_message_, "Execution error: no backend today");

  auto command = engine_->run_command("ls");
  EXPECT_EQ(command.status_, ExecutionStatus::Failed);
  EXPECT_EQ(command.command_, "ls");
}

TEST_F(EngineTest, PolicyCanBeSwitched) {
  start(security::SecurityLevel::Moderate);
  EXPECT_EQ(engine_->policy().level_, security::SecurityLevel::Moderate);

  ASSERT_TRUE(engine_->set_policy(security::policy_for_level(security::SecurityLevel::Strict)).has_value());
  EXPECT_EQ(engine_->policy().level_, security::SecurityLevel::Strict);

  auto invalid                           = security::policy_for_level(security::SecurityLevel::Strict);
  invalid.resources_.max_output_size_mb_ = 0;
  EXPECT_FALSE(engine_->set_policy(invalid).has_value());
  EXPECT_EQ(engine_->policy().level_, security::SecurityLevel::Strict);
}

TEST_F(EngineTest, LanguageLists) {
  start(security::SecurityLevel::Moderate);

  auto supported = engine_->list_supported_languages();
  EXPECT_NE(std::find(supported.begin(), supported.end(), "python"), supported.end());
  EXPECT_NE(std::find(supported.begin(), supported.end(), "rust"), supported.end());
  EXPECT_LE(engine_->list_available_languages().size(), supported.size());
}

} // namespace xrun::exec::test
