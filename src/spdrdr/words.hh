#ifndef SPDRDR_WORDS_HH
#define SPDRDR_WORDS_HH

#include <cstddef>

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <istream>

// split the input on whitespace
// a token made only of full width graphemes is split into one word per grapheme
std::vector<std::string> parse_words(std::istream& input);

// percentage of 'pos' in 'total' truncated to 5 decimal places
std::string percent(std::size_t const pos, std::size_t const total);

// grapheme index of the focus character, ignoring surrounding punctuation
std::size_t focus_point(std::string_view const word);

class Word_Window
{
public:

  // current word and its neighbours
  struct Chunk
  {
    std::vector<std::string_view> words;

    // position of the current word in 'words'
    std::size_t offset {0};
  };

  explicit Word_Window(std::vector<std::string> words);

  std::string const& advance();
  std::string const& retreat();

  std::string const& seek(std::size_t const index);
  std::string const& begin();
  std::string const& end();

  std::string const& word() const;
  std::size_t index() const;
  std::size_t size() const;

  bool is_begin() const;
  bool is_end() const;

  std::pair<std::size_t, std::size_t> progress() const;

  Chunk window_around(std::size_t const size) const;

private:

  std::vector<std::string> const _words;

  // index of the current word
  std::size_t _index {0};
};

#endif // SPDRDR_WORDS_HH
