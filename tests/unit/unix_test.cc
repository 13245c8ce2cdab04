#include "procex/unix.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace procex {

TEST(UnixTest, RawWaitStatusRoundTrip) {
  ExitStatus status = ExitStatus::other(123);
  auto raw = procex::unix::raw_wait_status(status);
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(raw.value(), 123);
}

TEST(UnixTest, TerminatingSignalExtractsSignal) {
  int raw_status = SIGTERM;
  ExitStatus status = ExitStatus::other(static_cast<std::uint32_t>(raw_status));
  auto signal = procex::unix::terminating_signal(status);
  ASSERT_TRUE(signal.has_value());
  EXPECT_EQ(signal.value(), SIGTERM);
}

TEST(UnixTest, FromWaitStatusDecodesExitCode) {
  int raw_status = 3 << 8;
  ExitStatus status = procex::unix::from_wait_status(raw_status);
  ASSERT_TRUE(status.code().has_value());
  EXPECT_EQ(status.code().value(), 3);
  EXPECT_EQ(status.native(), static_cast<std::uint32_t>(raw_status));
  EXPECT_FALSE(procex::unix::terminating_signal(status).has_value());
}

TEST(UnixTest, FromWaitStatusKeepsSignalStatus) {
  ExitStatus status = procex::unix::from_wait_status(SIGKILL);
  EXPECT_EQ(status.kind(), ExitStatus::Kind::other);
  EXPECT_EQ(procex::unix::terminating_signal(status).value_or(0), SIGKILL);
}

TEST(UnixTest, SignalNameCoversCommonSignals) {
  EXPECT_EQ(procex::unix::signal_name(SIGTERM).value_or(""), "SIGTERM");
  EXPECT_EQ(procex::unix::signal_name(SIGPIPE).value_or(""), "SIGPIPE");
  EXPECT_FALSE(procex::unix::signal_name(0).has_value());
}

}  // namespace procex
