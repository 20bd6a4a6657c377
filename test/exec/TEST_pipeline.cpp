#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include <fmt/core.h>
#include <gtest/gtest.h>

#include "exec/fakes.hpp"
#include "xrun/exec/pipeline.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::exec::test {

using namespace std::chrono_literals;

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    runner_ = std::make_unique<ScriptedRunner>();
    policy_ = security::policy_for_level(security::SecurityLevel::Moderate);
  }

  void TearDown() override {
    runner_.reset();
  }

  auto options_for(runtime::Language language, Timeout timeout = std::nullopt) -> PipelineOptions {
    return pipeline_options(policy_, runtime::config_for(language), timeout, BackendOptions{}, true);
  }

  std::unique_ptr<ScriptedRunner> runner_;
  security::SecurityPolicy        policy_;
};

TEST_F(PipelineTest, InterpretedSnippetRunsOnce) {
  std::string seen_source;
  std::filesystem::path work_dir;
  runner_->handler_ = [&](process::RunRequest const& request) -> core::Result<process::RunOutcome> {
    work_dir = request.work_dir_;
    std::ifstream input(request.argv_.at(1));
    seen_source.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    return exited(0, "4\n");
  };

  auto const& config = runtime::config_for(runtime::Language::Python);
  auto        result = run_pipeline(*runner_, config, "print(2 + 2)", options_for(runtime::Language::Python));

  EXPECT_EQ(result.status_, ExecutionStatus::Completed);
  EXPECT_EQ(result.stdout_, "4\n");
  EXPECT_EQ(result.return_code_, 0);
  EXPECT_FALSE(result.error_message_.has_value());

  ASSERT_EQ(runner_->requests_.size(), 1u);
  EXPECT_EQ(runner_->requests_[0].argv_.front(), "python3");
  EXPECT_EQ(seen_source, "print(2 + 2)");
  EXPECT_FALSE(work_dir.empty());
  EXPECT_FALSE(std::filesystem::exists(work_dir));
}

TEST_F(PipelineTest, CompileFailureNeverRuns) {
  std::filesystem::path work_dir;
  runner_->handler_ = [&](process::RunRequest const& request) -> core::Result<process::RunOutcome> {
    work_dir = request.work_dir_;
    return exited(1, "", "main.cpp:1: error: expected ';'");
  };

  auto const& config = runtime::config_for(runtime::Language::Cpp);
  auto        result = run_pipeline(*runner_, config, "int main() { return 0 }", options_for(runtime::Language::Cpp));

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  EXPECT_EQ(result.return_code_, 1);
  EXPECT_EQ(result.stderr_, "main.cpp:1: error: expected ';'");
  EXPECT_EQ(result.error_message_, "Compilation failed with exit code 1");
  EXPECT_EQ(runner_->requests_.size(), 1u);
  ASSERT_FALSE(work_dir.empty());
  EXPECT_FALSE(std::filesystem::exists(work_dir));
}

TEST_F(PipelineTest, TimedOutRunRemovesWorkspace) {
  std::filesystem::path work_dir;
  bool                  existed = false;
  runner_->handler_ = [&](process::RunRequest const& request) -> core::Result<process::RunOutcome> {
    work_dir        = request.work_dir_;
    existed         = std::filesystem::exists(work_dir / "main.py");
    auto outcome    = timed_out();
    outcome.stdout_ = "partial";
    return outcome;
  };

  auto const& config = runtime::config_for(runtime::Language::Python);
  auto        result = run_pipeline(*runner_, config, "while True: pass", options_for(runtime::Language::Python, 1s));

  EXPECT_EQ(result.status_, ExecutionStatus::Timeout);
  EXPECT_EQ(result.stdout_, "partial");
  EXPECT_EQ(result.error_message_, "Execution timed out after 1 seconds");
  EXPECT_TRUE(existed);
  ASSERT_FALSE(work_dir.empty());
  EXPECT_FALSE(std::filesystem::exists(work_dir));
}

TEST_F(PipelineTest, RunnerErrorRemovesWorkspace) {
  std::filesystem::path work_dir;
  runner_->handler_ = [&](process::RunRequest const& request) -> core::Result<process::RunOutcome> {
    work_dir = request.work_dir_;
    return std::unexpected(std::string{"fork failed"});
  };

  auto const& config = runtime::config_for(runtime::Language::Python);
  auto        result = run_pipeline(*runner_, config, "print(1)", options_for(runtime::Language::Python));

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  EXPECT_EQ(result.error_message_, "Execution error: fork failed");
  ASSERT_FALSE(work_dir.empty());
  EXPECT_FALSE(std::filesystem::exists(work_dir));
}

TEST_F(PipelineTest, CompiledSnippetRunsTheBinary) {
  runner_->push(exited(0));
  runner_->push(exited(0, "42\n"));

  auto const& config = runtime::config_for(runtime::Language::Cpp);
  auto        result = run_pipeline(*runner_, config, "int main() {}", options_for(runtime::Language::Cpp));

  EXPECT_EQ(result.status_, ExecutionStatus::Completed);
  EXPECT_EQ(result.stdout_, "42\n");

  ASSERT_EQ(runner_->requests_.size(), 2u);
  auto const& compile = runner_->requests_[0];
  auto const& run     = runner_->requests_[1];
  EXPECT_EQ(compile.argv_.front(), "g++");
  EXPECT_FALSE(compile.limits_.address_space_bytes_.has_value());
  EXPECT_EQ(compile.timeout_, std::chrono::milliseconds{core::constant::DEFAULT_COMPILE_TIMEOUT});
  EXPECT_TRUE(run.argv_.front().ends_with("/main"));
  EXPECT_TRUE(run.limits_.address_space_bytes_.has_value());
}

TEST_F(PipelineTest, CompileTimeoutIsReported) {
  runner_->push(timed_out());

  auto const& config = runtime::config_for(runtime::Language::Rust);
  auto        result = run_pipeline(*runner_, config, "fn main() {}", options_for(runtime::Language::Rust));

  EXPECT_EQ(result.status_, ExecutionStatus::Timeout);
  EXPECT_EQ(result.return_code_, -1);
  EXPECT_EQ(result.error_message_, "Compilation timed out after 60 seconds");
  EXPECT_EQ(runner_->requests_.size(), 1u);
}

TEST_F(PipelineTest, CompilerThatCannotStart) {
  runner_->push_error("failed to execute 'g++': No such file or directory");

  auto const& config = runtime::config_for(runtime::Language::Cpp);
  auto        result = run_pipeline(*runner_, config, "int main() {}", options_for(runtime::Language::Cpp));

  EXPECT_EQ(result.status_, ExecutionStatus::Failed);
  ASSERT_TRUE(result.error_message_.has_value());
  EXPECT_TRUE(result.error_message_->starts_with("Compilation error: "));
}

TEST_F(PipelineTest, CommandDirectoryOverridesHostPath) {
  auto options         = options_for(runtime::Language::Python);
  options.command_dir_ = "/workspace";

  auto result = run_pipeline(*runner_, runtime::config_for(runtime::Language::Python), "print(1)", options);

  EXPECT_EQ(result.status_, ExecutionStatus::Completed);
  ASSERT_EQ(runner_->requests_.size(), 1u);
  EXPECT_EQ(runner_->requests_[0].argv_.at(1), "/workspace/main.py");
}

TEST_F(PipelineTest, TimeoutMapping) {
  auto result = to_execution_result(timed_out(), 2500ms, 0, 1024);

  EXPECT_EQ(result.status_, ExecutionStatus::Timeout);
  EXPECT_EQ(result.return_code_, -1);
  EXPECT_EQ(result.error_message_, "Execution timed out after 2.5 seconds");
}

TEST_F(PipelineTest, CpuLimitCountsAsTimeout) {
  process::RunOutcome outcome;
  outcome.signaled_ = true;
  outcome.signal_   = SIGXCPU;

  auto result = to_execution_result(outcome, 3s, 0, 1024);
  EXPECT_EQ(result.status_, ExecutionStatus::Timeout);
  EXPECT_EQ(result.error_message_, "Execution timed out after 3 seconds");
}

TEST_F(PipelineTest, TruncatedOutputIsMemoryLimit) {
  auto outcome              = exited(0, std::string(16, 'x'));
  outcome.output_truncated_ = true;

  auto result = to_execution_result(outcome, 1s, 0, 10 * core::constant::MEGABYTE);
  EXPECT_EQ(result.status_, ExecutionStatus::MemoryLimit);
  EXPECT_EQ(result.error_message_, "Output exceeded the 10 MB limit");
}

TEST_F(PipelineTest, ResidentSetOverLimitIsMemoryLimit) {
  auto outcome        = exited(0);
  outcome.max_rss_kb_ = 300 * 1024;

  auto result = to_execution_result(outcome, 1s, 256, 1024);
  EXPECT_EQ(result.status_, ExecutionStatus::MemoryLimit);
  EXPECT_EQ(result.error_message_, "Memory usage 300.0 MB exceeded the 256 MB limit");

  EXPECT_EQ(to_execution_result(outcome, 1s, 0, 1024).status_, ExecutionStatus::Completed);
}

TEST_F(PipelineTest, FailureMessages) {
  auto exit_result = to_execution_result(exited(2, "", "Traceback"), 1s, 0, 1024);
  EXPECT_EQ(exit_result.status_, ExecutionStatus::Failed);
  EXPECT_EQ(exit_result.return_code_, 2);
  EXPECT_EQ(exit_result.stderr_, "Traceback");
  EXPECT_EQ(exit_result.error_message_, "Process exited with code 2");

  process::RunOutcome crashed;
  crashed.signaled_  = true;
  crashed.signal_    = SIGSEGV;
  crashed.exit_code_ = 128 + SIGSEGV;
  auto signal_result = to_execution_result(crashed, 1s, 0, 1024);
  EXPECT_EQ(signal_result.error_message_, fmt::format("Process terminated by signal {}", SIGSEGV));

  auto error_result = to_execution_result(std::unexpected(std::string{"boom"}), 1s, 0, 1024);
  EXPECT_EQ(error_result.status_, ExecutionStatus::Failed);
  EXPECT_EQ(error_result.return_code_, -1);
  EXPECT_EQ(error_result.error_message_, "Execution error: boom");
}

TEST_F(PipelineTest, TimeoutDefaultsToScaledPolicyValue) {
  auto const& java = runtime::config_for(runtime::Language::Java);

  EXPECT_EQ(effective_timeout(std::nullopt, policy_, java), 45s);
  EXPECT_EQ(effective_timeout(5s, policy_, java), 5s);
}

TEST_F(PipelineTest, StrictLimits) {
  auto strict = security::policy_for_level(security::SecurityLevel::Strict);
  auto limits = run_limits(strict, runtime::config_for(runtime::Language::Python), 15s, true);

  EXPECT_EQ(limits.address_space_bytes_, 256 * core::constant::MEGABYTE);
  EXPECT_EQ(limits.cpu_seconds_, 16u);
  EXPECT_EQ(limits.file_size_bytes_, 50 * core::constant::MEGABYTE);
  EXPECT_EQ(limits.max_processes_, 2u);
}

TEST_F(PipelineTest, ModerateLimits) {
  auto const& rust = runtime::config_for(runtime::Language::Rust);

  EXPECT_EQ(run_limits(policy_, rust, 1500ms, true).address_space_bytes_, 768 * core::constant::MEGABYTE);
  EXPECT_EQ(run_limits(policy_, rust, 1500ms, false).address_space_bytes_, 512 * core::constant::MEGABYTE);
  EXPECT_EQ(run_limits(policy_, rust, 1500ms, false).cpu_seconds_, 3u);
  EXPECT_FALSE(run_limits(policy_, rust, 1s, true).max_processes_.has_value());

  auto const& node = runtime::config_for(runtime::Language::JavaScript);
  EXPECT_FALSE(run_limits(policy_, node, 1s, true).address_space_bytes_.has_value());
}

TEST_F(PipelineTest, CompileLimitsSkipMemory) {
  auto limits = compile_limits(policy_, 60s);
  EXPECT_FALSE(limits.address_space_bytes_.has_value());
  EXPECT_FALSE(limits.max_processes_.has_value());
  EXPECT_EQ(limits.cpu_seconds_, 61u);
}

TEST_F(PipelineTest, OptionsCarryPolicyEnvironment) {
  BackendOptions backend;
  backend.inherited_env_ = {{"PATH", "/opt/bin"}, {"LD_PRELOAD", "x.so"}};

  auto strict  = security::policy_for_level(security::SecurityLevel::Strict);
  auto options = pipeline_options(strict, runtime::config_for(runtime::Language::Python), std::nullopt, backend, true);

  ASSERT_TRUE(options.env_.has_value());
  EXPECT_EQ(options.env_->at("PATH"), "/usr/bin:/bin");
  EXPECT_EQ(options.max_output_bytes_, 5 * core::constant::MEGABYTE);
  EXPECT_EQ(options.run_timeout_, 15s);
  EXPECT_EQ(options.memory_limit_mb_, 256);
}

TEST_F(PipelineTest, SecurityGateRefusesUnsafeCode) {
  auto scanner = security::Scanner::compile(policy_);
  ASSERT_TRUE(scanner.has_value());

  auto refusal = security_gate(*scanner, CodeBlock{"import os\nos.system('id')", runtime::Language::Python, {}});
  ASSERT_TRUE(refusal.has_value());
  EXPECT_TRUE(is_security_refusal(*refusal));
  EXPECT_TRUE(refusal->stderr_.starts_with("Security scan failed: "));
  EXPECT_EQ(refusal->return_code_, -1);

  EXPECT_FALSE(security_gate(*scanner, CodeBlock{"print(1)", runtime::Language::Python, {}}).has_value());
}

TEST_F(PipelineTest, SecurityGateCanBeDisabled) {
  policy_.enable_security_scanning_ = false;
  auto scanner                      = security::Scanner::compile(policy_);
  ASSERT_TRUE(scanner.has_value());

  EXPECT_FALSE(security_gate(*scanner, CodeBlock{"import os", runtime::Language::Python, {}}).has_value());
}

TEST_F(PipelineTest, SecondsFormatting) {
  EXPECT_EQ(format_seconds(30s), "30");
  EXPECT_EQ(format_seconds(1500ms), "1.5");
}

} // namespace xrun::exec::test
