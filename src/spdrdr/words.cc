#include "spdrdr/words.hh"

#include "ob/text.hh"

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <istream>
#include <algorithm>
#include <stdexcept>

std::vector<std::string> parse_words(std::istream& input)
{
  std::vector<std::string> words;
  std::string token;

  while (input >> token)
  {
    OB::Text text {token};

    if (text.size() > 1 && text.cols() == text.size() * 2)
    {
      for (auto const& e : text)
      {
        words.emplace_back(e.str);
      }
    }
    else
    {
      words.emplace_back(std::move(token));
    }
  }

  return words;
}

std::string percent(std::size_t const pos, std::size_t const total)
{
  if (total == 0)
  {
    throw std::invalid_argument("percent of an empty total");
  }

  std::uint64_t constexpr scale {100000};

  auto const value = static_cast<std::uint64_t>(pos) * 100 * scale / total;
  auto const frac = std::to_string(value % scale);

  return std::to_string(value / scale) + "." +
    std::string(5 - frac.size(), '0') + frac;
}

std::size_t focus_point(std::string_view const word)
{
  OB::Text const text {word};

  if (text.empty())
  {
    return 0;
  }

  std::size_t begin {0};
  std::size_t end {text.size()};

  // leading punct
  while (begin < end && OB::Text::is_punct(OB::Text::to_int32(text.at(begin).str)))
  {
    ++begin;
  }

  // trailing punct
  while (end > begin && OB::Text::is_punct(OB::Text::to_int32(text.at(end - 1).str)))
  {
    --end;
  }

  if (begin == end)
  {
    return (text.size() - 1) / 2;
  }

  return begin + (end - begin) / 2;
}

Word_Window::Word_Window(std::vector<std::string> words) :
  _words {std::move(words)}
{
  if (_words.empty())
  {
    throw std::invalid_argument("the document contains no words");
  }
}

std::string const& Word_Window::advance()
{
  if (_index + 1 < _words.size())
  {
    ++_index;
  }

  return word();
}

std::string const& Word_Window::retreat()
{
  if (_index > 0)
  {
    --_index;
  }

  return word();
}

std::string const& Word_Window::seek(std::size_t const index)
{
  _index = std::min(index, _words.size() - 1);

  return word();
}

std::string const& Word_Window::begin()
{
  return seek(0);
}

std::string const& Word_Window::end()
{
  return seek(_words.size() - 1);
}

std::string const& Word_Window::word() const
{
  return _words.at(_index);
}

std::size_t Word_Window::index() const
{
  return _index;
}

std::size_t Word_Window::size() const
{
  return _words.size();
}

bool Word_Window::is_begin() const
{
  return _index == 0;
}

bool Word_Window::is_end() const
{
  return _index + 1 == _words.size();
}

std::pair<std::size_t, std::size_t> Word_Window::progress() const
{
  return {_index, _words.size()};
}

Word_Window::Chunk Word_Window::window_around(std::size_t const size) const
{
  if (size == 0)
  {
    throw std::invalid_argument("chunk size must be at least 1");
  }

  // windows start on a grid two thirds of a chunk apart
  // and keep a sixth of a chunk ahead of the current word when they can
  auto const step = std::max<std::size_t>(1, size * 2 / 3);
  auto const lead = size / 6;

  std::size_t start {0};

  if (_index >= lead)
  {
    start = (_index - lead) / step * step;
  }

  if (_words.size() > size)
  {
    start = std::min(start, _words.size() - size);
  }
  else
  {
    start = 0;
  }

  auto const stop = std::min(start + size, _words.size());

  Chunk chunk;
  chunk.words.reserve(stop - start);

  for (auto i = start; i < stop; ++i)
  {
    chunk.words.emplace_back(_words.at(i));
  }

  chunk.offset = _index - start;

  return chunk;
}
