#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "xrun/security/policy.hpp"
#include "xrun/security/scanner.hpp"

namespace xrun::security::test {

class ScannerTest : public ::testing::Test {
protected:
  void SetUp() override {
    strict_     = make_scanner(SecurityLevel::Strict);
    moderate_   = make_scanner(SecurityLevel::Moderate);
    permissive_ = make_scanner(SecurityLevel::Permissive);
  }

  void TearDown() override {
    strict_.reset();
    moderate_.reset();
    permissive_.reset();
  }

  static auto make_scanner(SecurityLevel level) -> std::unique_ptr<Scanner> {
    auto scanner = Scanner::compile(policy_for_level(level));
    EXPECT_TRUE(scanner.has_value());
    return std::make_unique<Scanner>(*std::move(scanner));
  }

  std::unique_ptr<Scanner> strict_;
  std::unique_ptr<Scanner> moderate_;
  std::unique_ptr<Scanner> permissive_;
};

TEST_F(ScannerTest, PlainArithmeticIsSafe) {
  auto result = strict_->scan_code("print(1 + 1)", "python");
  EXPECT_TRUE(result.is_safe_);
  EXPECT_TRUE(result.violated_patterns_.empty());
}

TEST_F(ScannerTest, DangerousImportIsReported) {
  auto result = moderate_->scan_code("import os\nos.system('ls')", "python");

  EXPECT_FALSE(result.is_safe_);
  EXPECT_NE(result.reason_.find("Dangerous pattern detected"), std::string::npos);
  ASSERT_GE(result.violated_patterns_.size(), 2u);
  EXPECT_EQ(result.violated_patterns_[0], R"(import\s+os)");
}

TEST_F(ScannerTest, MatchingIgnoresCase) {
  auto result = strict_->scan_code("IMPORT OS", "python");
  EXPECT_FALSE(result.is_safe_);
}

TEST_F(ScannerTest, AllowedImportPasses) {
  auto result = strict_->scan_code("import math\nprint(math.pi)", "python");
  EXPECT_TRUE(result.is_safe_) << result.reason_;
}

TEST_F(ScannerTest, UnlistedImportIsRejected) {
  auto result = strict_->scan_code("import numpy\nprint(numpy.zeros(3))", "python");

  EXPECT_FALSE(result.is_safe_);
  EXPECT_NE(result.reason_.find("Unsafe import detected"), std::string::npos);
}

TEST_F(ScannerTest, StandardHeadersCountAsAllowed) {
  auto result = moderate_->scan_code("#include <iostream>\nint main() { std::cout << 1; }", "cpp");
  EXPECT_TRUE(result.is_safe_) << result.reason_;
}

TEST_F(ScannerTest, PermissiveAllowsAnyImport) {
  auto result = permissive_->scan_code("import os\nprint(os.getcwd())", "python");
  EXPECT_TRUE(result.is_safe_) << result.reason_;
}

TEST_F(ScannerTest, PermissiveStillRejectsSubprocess) {
  auto result = permissive_->scan_code("import subprocess", "python");
  EXPECT_FALSE(result.is_safe_);
}

TEST_F(ScannerTest, InvalidPatternFailsCompilation) {
  auto policy = policy_for_level(SecurityLevel::Moderate);
  policy.patterns_.custom_.push_back("(unclosed");

  auto scanner = Scanner::compile(policy);
  ASSERT_FALSE(scanner.has_value());
  EXPECT_NE(scanner.error().find("invalid pattern"), std::string::npos);
}

TEST_F(ScannerTest, CustomPatternsAreScanned) {
  auto policy = policy_for_level(SecurityLevel::Moderate);
  policy.patterns_.custom_.push_back(R"(forbidden_call\s*\()");

  auto scanner = Scanner::compile(policy);
  ASSERT_TRUE(scanner.has_value());
  EXPECT_FALSE(scanner->scan_code("forbidden_call()", "python").is_safe_);
}

TEST_F(ScannerTest, EmptyCommandIsRejected) {
  auto result = moderate_->scan_command("   ");
  EXPECT_FALSE(result.is_safe_);
  EXPECT_EQ(result.reason_, "Empty command");
}

TEST_F(ScannerTest, OverlongCommandIsRejected) {
  auto result = strict_->scan_command("echo " + std::string(600, 'a'));
  EXPECT_FALSE(result.is_safe_);
  EXPECT_NE(result.reason_.find("Command too long"), std::string::npos);
}

TEST_F(ScannerTest, StrictBlocksDangerousCommand) {
  auto result = strict_->scan_command("rm -rf /");
  EXPECT_FALSE(result.is_safe_);
  EXPECT_NE(result.reason_.find("Dangerous command 'rm' blocked"), std::string::npos);
}

TEST_F(ScannerTest, BaseNameOfCommandIsChecked) {
  auto result = strict_->scan_command("/bin/RM -rf /tmp/x");
  EXPECT_FALSE(result.is_safe_);
  ASSERT_FALSE(result.violated_patterns_.empty());
  EXPECT_EQ(result.violated_patterns_.front(), "rm");
}

TEST_F(ScannerTest, StrictRequiresWhitelist) {
  EXPECT_TRUE(strict_->scan_command("ls -la").is_safe_);

  auto result = strict_->scan_command("perl -e 1");
  EXPECT_FALSE(result.is_safe_);
  EXPECT_NE(result.reason_.find("not in allowed list"), std::string::npos);
}

TEST_F(ScannerTest, ModerateBlocksPrivilegeEscalation) {
  auto result = moderate_->scan_command("sudo ls");
  EXPECT_FALSE(result.is_safe_);
  EXPECT_NE(result.reason_.find("Privilege escalation"), std::string::npos);
}

TEST_F(ScannerTest, ModerateBlocksChainedRemoval) {
  auto result = moderate_->scan_command("ls; rm -rf build");
  EXPECT_FALSE(result.is_safe_);
  EXPECT_NE(result.reason_.find("Blocked command pattern detected"), std::string::npos);
}

TEST_F(ScannerTest, ModerateAllowsOrdinaryCommands) {
  EXPECT_TRUE(moderate_->scan_command("echo hello").is_safe_);
  EXPECT_TRUE(moderate_->scan_command("python3 --version").is_safe_);
}

TEST_F(ScannerTest, ImportDetectionPerLanguage) {
  EXPECT_TRUE(contains_import("from json import dumps", "python"));
  EXPECT_TRUE(contains_import("const fs = require('fs')", "javascript"));
  EXPECT_TRUE(contains_import("#include <vector>", "cpp"));
  EXPECT_TRUE(contains_import("use std::io;", "rust"));
  EXPECT_FALSE(contains_import("print('important')", "python"));
}

TEST_F(ScannerTest, PrivilegedCommands) {
  EXPECT_TRUE(is_privileged_command("sudo"));
  EXPECT_TRUE(is_privileged_command("pkill"));
  EXPECT_FALSE(is_privileged_command("rm"));
}

} // namespace xrun::security::test
