#include "parseloglevel.hpp"

#include <gtest/gtest.h>

#include "tnc_exception.hpp"
#include "tnc_log.hpp"

namespace tnc {
TEST(ParseLogLevel, InvalidLogName) { EXPECT_THROW(LogPosFromLogStr("invalid"), exception); }

TEST(ParseLogLevel, InvalidLogDigit) {
  EXPECT_THROW(LogPosFromLogStr("7"), exception);
  EXPECT_THROW(LogPosFromLogStr("/"), exception);
  EXPECT_THROW(LogPosFromLogStr(""), exception);
}

TEST(ParseLogLevel, ValidLogName) {
  EXPECT_EQ(LogPosFromLogStr("off"), 0);
  EXPECT_EQ(LogPosFromLogStr("critical"), 1);
  EXPECT_EQ(LogPosFromLogStr("warning"), 3);
  EXPECT_EQ(LogPosFromLogStr("trace"), 6);
}

TEST(ParseLogLevel, ValidLogDigit) {
  EXPECT_EQ(LogPosFromLogStr("0"), 0);
  EXPECT_EQ(LogPosFromLogStr("4"), 4);
  EXPECT_EQ(LogPosFromLogStr("6"), 6);
}

TEST(ParseLogLevel, PositionToSpdlogLevel) {
  EXPECT_EQ(LevelFromPos(LogPosFromLogStr("off")), log::level::off);
  EXPECT_EQ(LevelFromPos(LogPosFromLogStr("error")), log::level::err);
  EXPECT_EQ(LevelFromPos(LogPosFromLogStr("info")), log::level::info);
  EXPECT_EQ(LevelFromPos(LogPosFromLogStr("trace")), log::level::trace);
  EXPECT_EQ(PosFromLevel(log::level::debug), 5);
}
}  // namespace tnc
