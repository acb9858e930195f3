#include "ob/string.hh"

#include <gtest/gtest.h>

#include <regex>
#include <string>
#include <vector>

TEST(String, SplitSkipsEmptyPieces)
{
  std::vector<std::string> const expected {"style", "focus", "red"};
  EXPECT_EQ(OB::String::split("style  focus red", " "), expected);
  EXPECT_EQ(OB::String::split(" style focus red ", " "), expected);
  EXPECT_TRUE(OB::String::split("", " ").empty());
}

TEST(String, SplitHonoursLimit)
{
  std::vector<std::string> const expected {"style", "focus", "red bright"};
  EXPECT_EQ(OB::String::split("style focus red bright", " ", 2), expected);

  std::vector<std::string> const names {"wpm", "w"};
  EXPECT_EQ(OB::String::split("wpm,w", ","), names);
}

TEST(String, Trim)
{
  EXPECT_EQ(OB::String::trim("  wpm 300\t\r\n"), "wpm 300");
  EXPECT_EQ(OB::String::trim("chunk"), "chunk");
  EXPECT_EQ(OB::String::trim(" \t "), "");
}

TEST(String, Match)
{
  auto const res = OB::String::match("chunk 12", std::regex("^(chunk)\\s+([0-9]+)$"));
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(res.value().size(), 3u);
  EXPECT_EQ(res.value().at(0), "chunk 12");
  EXPECT_EQ(res.value().at(2), "12");

  EXPECT_FALSE(OB::String::match("chunk x", std::regex("^chunk\\s+[0-9]+$")).has_value());
  EXPECT_TRUE(OB::String::assert_rx("#ff00ff", std::regex("^#[0-9a-f]{6}$")));
}

TEST(String, Repeat)
{
  EXPECT_EQ(OB::String::repeat(3, "-"), "---");
  EXPECT_EQ(OB::String::repeat(2, "ab"), "abab");
  EXPECT_EQ(OB::String::repeat(0, "-"), "");
}

TEST(String, ShellQuote)
{
  EXPECT_EQ(OB::String::shell_quote(""), "''");
  EXPECT_EQ(OB::String::shell_quote("book.txt"), "'book.txt'");
  EXPECT_EQ(OB::String::shell_quote("my book $HOME.txt"), "'my book $HOME.txt'");
  EXPECT_EQ(OB::String::shell_quote("it's.txt"), "'it'\\''s.txt'");
  EXPECT_EQ(OB::String::shell_quote("''"), "''\\'''\\'''");
}

TEST(String, ToInt)
{
  EXPECT_EQ(OB::String::to_int("300"), 300);
  EXPECT_EQ(OB::String::to_int("-1000"), -1000);
  EXPECT_EQ(OB::String::to_int("+7"), 7);
  EXPECT_FALSE(OB::String::to_int("").has_value());
  EXPECT_FALSE(OB::String::to_int("12a").has_value());
  EXPECT_FALSE(OB::String::to_int("1.5").has_value());
  EXPECT_FALSE(OB::String::to_int("99999999999").has_value());
}

TEST(String, DamerauLevenshtein)
{
  EXPECT_EQ(OB::String::damerau_levenshtein("wpm", "wpm"), 0u);
  EXPECT_EQ(OB::String::damerau_levenshtein("wmp", "wpm"), 1u);
  EXPECT_EQ(OB::String::damerau_levenshtein("chunks", "chunk"), 1u);
  EXPECT_EQ(OB::String::damerau_levenshtein("skp", "skip"), 1u);
  EXPECT_EQ(OB::String::damerau_levenshtein("kitten", "sitting"), 3u);
  EXPECT_EQ(OB::String::damerau_levenshtein("", "help"), 4u);
  EXPECT_EQ(OB::String::damerau_levenshtein("config", ""), 6u);
}
