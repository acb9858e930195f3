#include "spdrdr/log.hh"

#include <gtest/gtest.h>

#include <string>

TEST(DebugLog, DisabledLogKeepsNothing)
{
  Debug_Log log;

  log("loaded ", 12, " words");
  EXPECT_FALSE(log.enabled());
  EXPECT_EQ(log.size(), 0u);
  EXPECT_EQ(log.str(), "");
}

TEST(DebugLog, FormatsArguments)
{
  Debug_Log log {true};

  log("wpm ", 500, " chunk ", 40);
  ASSERT_EQ(log.size(), 1u);

  auto const str = log.str();
  EXPECT_EQ(str.front(), '[');
  EXPECT_NE(str.find("] wpm 500 chunk 40\n"), std::string::npos);
}

TEST(DebugLog, DropsOldestLinesPastLimit)
{
  Debug_Log log {true, 3};

  for (int i = 0; i < 5; ++i)
  {
    log("line ", i);
  }

  EXPECT_EQ(log.size(), 3u);

  auto const str = log.str();
  EXPECT_EQ(str.find("[...] 2 earlier lines dropped\n"), 0u);
  EXPECT_EQ(str.find("line 1"), std::string::npos);
  EXPECT_NE(str.find("line 2"), std::string::npos);
  EXPECT_NE(str.find("line 4"), std::string::npos);
}

TEST(DebugLog, CanBeEnabledLater)
{
  Debug_Log log;

  log("ignored");
  log.enabled(true);
  log("kept");

  EXPECT_EQ(log.size(), 1u);
  EXPECT_NE(log.str().find("kept"), std::string::npos);
  EXPECT_EQ(log.str().find("ignored"), std::string::npos);
}
