#include "spdrdr/words.hh"

#include <gtest/gtest.h>

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

std::vector<std::string> numbered(std::size_t const count)
{
  std::vector<std::string> words;
  for (std::size_t i = 0; i < count; ++i)
  {
    words.emplace_back("w" + std::to_string(i));
  }
  return words;
}

} // namespace

TEST(ParseWords, SplitsOnWhitespaceAndNewlines)
{
  std::istringstream in {"  The quick\n\tbrown   fox.\n\njumps  "};
  auto const words = parse_words(in);

  std::vector<std::string> const expected {"The", "quick", "brown", "fox.", "jumps"};
  EXPECT_EQ(words, expected);
}

TEST(ParseWords, EmptyInputYieldsNoWords)
{
  std::istringstream in {" \n\t \n"};
  EXPECT_TRUE(parse_words(in).empty());
}

TEST(ParseWords, SplitsFullWidthRuns)
{
  // three wide graphemes become three words, a mixed token stays whole
  std::istringstream in {"日本語 abc日本"};
  auto const words = parse_words(in);

  std::vector<std::string> const expected {"日", "本", "語", "abc日本"};
  EXPECT_EQ(words, expected);
}

TEST(WordWindow, RejectsEmptyDocument)
{
  EXPECT_THROW(Word_Window(std::vector<std::string> {}), std::invalid_argument);
}

TEST(WordWindow, StartsAtFirstWord)
{
  Word_Window window {{"one", "two", "three"}};

  EXPECT_EQ(window.index(), 0u);
  EXPECT_EQ(window.word(), "one");
  EXPECT_EQ(window.size(), 3u);
  EXPECT_TRUE(window.is_begin());
  EXPECT_FALSE(window.is_end());
}

TEST(WordWindow, AdvanceClampsAtLastWord)
{
  Word_Window window {{"one", "two", "three"}};

  EXPECT_EQ(window.advance(), "two");
  EXPECT_EQ(window.advance(), "three");
  EXPECT_TRUE(window.is_end());

  // idempotent at the boundary
  EXPECT_EQ(window.advance(), "three");
  EXPECT_EQ(window.advance(), "three");
  EXPECT_EQ(window.index(), 2u);
}

TEST(WordWindow, RetreatClampsAtFirstWord)
{
  Word_Window window {{"one", "two", "three"}};
  window.end();

  EXPECT_EQ(window.retreat(), "two");
  EXPECT_EQ(window.retreat(), "one");
  EXPECT_EQ(window.retreat(), "one");
  EXPECT_EQ(window.index(), 0u);
}

TEST(WordWindow, SingleWordDocumentNeverMoves)
{
  Word_Window window {{"only"}};

  EXPECT_EQ(window.advance(), "only");
  EXPECT_EQ(window.retreat(), "only");
  EXPECT_TRUE(window.is_begin());
  EXPECT_TRUE(window.is_end());
}

TEST(WordWindow, SeekClampsToLastWord)
{
  Word_Window window {numbered(10)};

  EXPECT_EQ(window.seek(4), "w4");
  EXPECT_EQ(window.seek(10), "w9");
  EXPECT_EQ(window.seek(1000), "w9");
  EXPECT_EQ(window.begin(), "w0");
}

TEST(WordWindow, ProgressReportsCursorAndTotal)
{
  Word_Window window {numbered(200)};
  window.seek(50);

  auto const [pos, total] = window.progress();
  EXPECT_EQ(pos, 50u);
  EXPECT_EQ(total, 200u);
  EXPECT_EQ(percent(pos, total), "25.00000");
}

TEST(Percent, TruncatesToFiveDecimals)
{
  EXPECT_EQ(percent(0, 3), "0.00000");
  EXPECT_EQ(percent(1, 3), "33.33333");
  EXPECT_EQ(percent(2, 3), "66.66666");
  EXPECT_EQ(percent(3, 3), "100.00000");
  EXPECT_EQ(percent(1, 7), "14.28571");
  EXPECT_EQ(percent(1, 100000000), "0.00000");
  EXPECT_THROW(percent(0, 0), std::invalid_argument);
}

TEST(WindowAround, ScenarioFourWordsChunkTwo)
{
  Word_Window window {{"The", "quick", "fox.", "jumps"}};
  window.seek(2);

  auto const chunk = window.window_around(2);
  ASSERT_LE(chunk.words.size(), 2u);
  ASSERT_LT(chunk.offset, chunk.words.size());
  EXPECT_EQ(chunk.words.at(chunk.offset), "fox.");
}

TEST(WindowAround, RejectsZeroChunk)
{
  Word_Window window {numbered(5)};
  EXPECT_THROW(window.window_around(0), std::invalid_argument);
}

TEST(WindowAround, ContainsCursorForEverySizeAndPosition)
{
  for (std::size_t total : {1u, 2u, 7u, 40u, 41u, 100u})
  {
    Word_Window window {numbered(total)};

    for (std::size_t size = 1; size <= 45; ++size)
    {
      for (std::size_t pos = 0; pos < total; ++pos)
      {
        window.seek(pos);
        auto const chunk = window.window_around(size);

        ASSERT_LE(chunk.words.size(), size);
        ASSERT_LT(chunk.offset, chunk.words.size());
        ASSERT_EQ(chunk.words.at(chunk.offset), window.word())
          << "total " << total << " size " << size << " pos " << pos;
      }
    }
  }
}

TEST(WindowAround, WholeDocumentWhenSmallerThanChunk)
{
  Word_Window window {numbered(5)};
  window.seek(3);

  auto const chunk = window.window_around(40);
  EXPECT_EQ(chunk.words.size(), 5u);
  EXPECT_EQ(chunk.offset, 3u);
}

TEST(WindowAround, StartsOnGridAndStaysStable)
{
  // chunk 12: grid step 8, lead 2
  Word_Window window {numbered(100)};

  window.seek(9);
  auto const first = window.window_around(12);
  EXPECT_EQ(first.words.front(), "w0");
  EXPECT_EQ(first.offset, 9u);

  // the window only moves once the cursor is a lead past the next grid line
  window.seek(10);
  auto const second = window.window_around(12);
  EXPECT_EQ(second.words.front(), "w8");
  EXPECT_EQ(second.offset, 2u);

  window.seek(17);
  EXPECT_EQ(window.window_around(12).words.front(), "w8");
}

TEST(WindowAround, ClampsToDocumentEnd)
{
  Word_Window window {numbered(50)};
  window.end();

  auto const chunk = window.window_around(40);
  EXPECT_EQ(chunk.words.size(), 40u);
  EXPECT_EQ(chunk.words.front(), "w10");
  EXPECT_EQ(chunk.words.back(), "w49");
  EXPECT_EQ(chunk.offset, 39u);
}

TEST(FocusPoint, MiddleOfLetters)
{
  EXPECT_EQ(focus_point("a"), 0u);
  EXPECT_EQ(focus_point("word"), 2u);
  EXPECT_EQ(focus_point("hello"), 2u);
}

TEST(FocusPoint, IgnoresSurroundingPunctuation)
{
  // "example" is 7 letters, its middle is index 3
  EXPECT_EQ(focus_point("example."), 3u);
  EXPECT_EQ(focus_point("\"example,\""), 4u);
  EXPECT_EQ(focus_point("(hi)"), 2u);
}

TEST(FocusPoint, CountsGraphemesNotBytes)
{
  // 'é' is two bytes but one grapheme
  EXPECT_EQ(focus_point("café"), 2u);
  EXPECT_EQ(focus_point("日本語"), 1u);
}

TEST(FocusPoint, AllPunctuationUsesWholeWord)
{
  EXPECT_EQ(focus_point("..."), 1u);
  EXPECT_EQ(focus_point(""), 0u);
}
