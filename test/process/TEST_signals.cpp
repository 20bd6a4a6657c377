#include <chrono>
#include <csignal>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "xrun/process/signals.hpp"

namespace xrun::process::test {

using namespace std::chrono_literals;

// Virtual clock; the group dies after the configured signal arrives.
class FakeSignalOps : public SignalOps {
public:
  std::vector<int>                      sent_;
  bool                                  alive_      = true;
  int                                   dies_after_ = SIGTERM;
  std::chrono::steady_clock::time_point clock_{};

  auto send_group(pid_t, int signal) -> bool override {
    sent_.push_back(signal);
    if (signal == dies_after_ || signal == SIGKILL) {
      alive_ = false;
    }
    return true;
  }

  auto group_alive(pid_t) -> bool override { return alive_; }

  void sleep_for(std::chrono::milliseconds duration) override { clock_ += duration; }

  auto now() -> std::chrono::steady_clock::time_point override { return clock_; }
};

class TerminateGroupTest : public ::testing::Test {
protected:
  void SetUp() override {
    ops_ = std::make_unique<FakeSignalOps>();
  }

  void TearDown() override {
    ops_.reset();
  }

  std::unique_ptr<FakeSignalOps> ops_;
};

TEST_F(TerminateGroupTest, GoneGroupIsLeftAlone) {
  ops_->alive_ = false;

  EXPECT_EQ(terminate_group(1234, 100ms, *ops_), Escalation::AlreadyGone);
  EXPECT_TRUE(ops_->sent_.empty());
}

TEST_F(TerminateGroupTest, InvalidGroupIsIgnored) {
  EXPECT_EQ(terminate_group(0, 100ms, *ops_), Escalation::AlreadyGone);
  EXPECT_TRUE(ops_->sent_.empty());
}

TEST_F(TerminateGroupTest, CooperativeGroupOnlyGetsSigterm) {
  EXPECT_EQ(terminate_group(1234, 100ms, *ops_), Escalation::Terminated);
  EXPECT_EQ(ops_->sent_, (std::vector<int>{SIGTERM}));
}

TEST_F(TerminateGroupTest, StubbornGroupIsKilledAfterGrace) {
  ops_->dies_after_ = 0;

  auto start = ops_->now();
  EXPECT_EQ(terminate_group(1234, 500ms, *ops_), Escalation::Killed);
  EXPECT_EQ(ops_->sent_, (std::vector<int>{SIGTERM, SIGKILL}));
  EXPECT_GE(ops_->now() - start, 500ms);
  EXPECT_FALSE(ops_->alive_);
}

} // namespace xrun::process::test
