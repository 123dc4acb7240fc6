#include "logwire/base-fd.hpp"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>

#include <utility>

namespace logwire {

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }

}  // namespace

TEST(BaseFdTest, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
  fd.close();
}

TEST(BaseFdTest, ClosesOnDestruction) {
  int raw = ::dup(STDOUT_FILENO);
  ASSERT_NE(raw, -1);
  {
    BaseFd fd(raw);
    EXPECT_TRUE(fd);
    EXPECT_TRUE(IsOpen(raw));
  }
  EXPECT_FALSE(IsOpen(raw));
}

TEST(BaseFdTest, MoveTransfersOwnership) {
  int raw = ::dup(STDOUT_FILENO);
  ASSERT_NE(raw, -1);
  BaseFd first(raw);
  BaseFd second(std::move(first));
  EXPECT_FALSE(first);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(second.fd(), raw);

  BaseFd third;
  third = std::move(second);
  EXPECT_EQ(third.fd(), raw);
  EXPECT_TRUE(IsOpen(raw));
  third.close();
  EXPECT_FALSE(IsOpen(raw));
  third.close();
}

TEST(BaseFdTest, ResetClosesPreviousDescriptor) {
  int first = ::dup(STDOUT_FILENO);
  int second = ::dup(STDOUT_FILENO);
  ASSERT_NE(first, -1);
  ASSERT_NE(second, -1);
  BaseFd fd(first);
  fd.reset(second);
  EXPECT_FALSE(IsOpen(first));
  EXPECT_EQ(fd.fd(), second);
  fd.reset(second);
  EXPECT_TRUE(IsOpen(second));
  fd.reset();
  EXPECT_FALSE(fd);
  EXPECT_FALSE(IsOpen(second));
}

TEST(BaseFdTest, ReleaseDoesNotClose) {
  int raw = ::dup(STDOUT_FILENO);
  ASSERT_NE(raw, -1);
  {
    BaseFd fd(raw);
    EXPECT_EQ(fd.release(), raw);
    EXPECT_FALSE(fd);
  }
  EXPECT_TRUE(IsOpen(raw));
  ::close(raw);
}

}  // namespace logwire
