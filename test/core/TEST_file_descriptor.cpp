#include <array>
#include <cerrno>
#include <string_view>
#include <utility>

#include <fcntl.h>

#include <gtest/gtest.h>

#include "xrun/core/file_descriptor.hpp"

namespace xrun::core::test {

TEST(FileDescriptorTest, PipeCarriesData) {
  auto pipe = open_pipe();
  ASSERT_TRUE(pipe.has_value());

  auto written = pipe->write_.write("ping");
  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(*written, 4u);

  std::array<char, 16> buffer{};
  auto                 n = pipe->read_.read_some(buffer);
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(std::string_view(buffer.data(), *n), "ping");
}

TEST(FileDescriptorTest, ClosedWriterMeansEndOfFile) {
  auto pipe = open_pipe();
  ASSERT_TRUE(pipe.has_value());
  pipe->write_.reset();
  EXPECT_FALSE(pipe->write_.valid());

  std::array<char, 16> buffer{};
  auto                 n = pipe->read_.read_some(buffer);
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(*n, 0u);
}

TEST(FileDescriptorTest, PipeEndsCloseOnExec) {
  auto pipe = open_pipe();
  ASSERT_TRUE(pipe.has_value());

  EXPECT_NE(fcntl(pipe->read_.get(), F_GETFD) & FD_CLOEXEC, 0);
  EXPECT_NE(fcntl(pipe->write_.get(), F_GETFD) & FD_CLOEXEC, 0);
}

TEST(FileDescriptorTest, NonBlockingReadReportsAgain) {
  auto pipe = open_pipe();
  ASSERT_TRUE(pipe.has_value());
  ASSERT_TRUE(pipe->read_.set_nonblocking().has_value());

  std::array<char, 16> buffer{};
  auto                 n = pipe->read_.read_some(buffer);
  ASSERT_FALSE(n.has_value());
  EXPECT_EQ(n.error(), EAGAIN);
}

TEST(FileDescriptorTest, MoveTransfersOwnership) {
  auto pipe = open_pipe();
  ASSERT_TRUE(pipe.has_value());
  int fd = pipe->read_.get();

  FileDescriptor moved = std::move(pipe->read_);
  EXPECT_EQ(moved.get(), fd);
  EXPECT_FALSE(pipe->read_.valid());

  moved.reset();
  EXPECT_EQ(fcntl(fd, F_GETFD), -1);
}

} // namespace xrun::core::test
