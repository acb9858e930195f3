#include "ob/text.hh"

#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <unicode/utext.h>
#include <unicode/brkiter.h>

#include <cstddef>
#include <cstdint>

#include <memory>
#include <string>
#include <string_view>
#include <stdexcept>

namespace OB
{

Text::Text(std::string_view const str)
{
  this->str(str);
}

Text& Text::str(std::string_view const str)
{
  _src = str;
  _graphemes.clear();
  _cols = 0;

  if (str.empty())
  {
    return *this;
  }

  UErrorCode ec {U_ZERO_ERROR};

  std::unique_ptr<UText, decltype(&utext_close)> text {
    utext_openUTF8(nullptr, str.data(), static_cast<std::int64_t>(str.size()), &ec),
    utext_close};

  if (U_FAILURE(ec))
  {
    throw std::runtime_error(std::string("utext_openUTF8: ") + u_errorName(ec));
  }

  std::unique_ptr<icu::BreakIterator> iter {
    icu::BreakIterator::createCharacterInstance(icu::Locale::getDefault(), ec)};

  if (U_FAILURE(ec))
  {
    throw std::runtime_error(std::string("createCharacterInstance: ") + u_errorName(ec));
  }

  iter->setText(text.get(), ec);

  if (U_FAILURE(ec))
  {
    throw std::runtime_error(std::string("setText: ") + u_errorName(ec));
  }

  // boundaries are utf-8 byte offsets for a utf-8 utext
  for (auto begin = iter->first(), end = iter->next();
    end != icu::BreakIterator::DONE; begin = end, end = iter->next())
  {
    auto const offset = static_cast<std::size_t>(begin);
    auto const length = static_cast<std::size_t>(end - begin);

    auto const width = u_getIntPropertyValue(to_int32(str.substr(offset, length)),
      UCHAR_EAST_ASIAN_WIDTH);
    std::size_t const cols {(width == U_EA_FULLWIDTH || width == U_EA_WIDE) ? 2u : 1u};

    _graphemes.push_back({offset, cols, str.substr(offset, length)});
    _cols += cols;
  }

  return *this;
}

std::string_view Text::str() const
{
  return _src;
}

Text::Grapheme const& Text::at(std::size_t const pos) const
{
  return _graphemes.at(pos);
}

bool Text::empty() const
{
  return _graphemes.empty();
}

std::size_t Text::size() const
{
  return _graphemes.size();
}

std::size_t Text::bytes() const
{
  return _src.size();
}

std::size_t Text::cols() const
{
  return _cols;
}

std::size_t Text::cols(std::size_t const size) const
{
  std::size_t count {0};

  for (std::size_t i = 0; i < size && i < _graphemes.size(); ++i)
  {
    count += _graphemes.at(i).cols;
  }

  return count;
}

Text::const_iterator Text::begin() const
{
  return _graphemes.cbegin();
}

Text::const_iterator Text::end() const
{
  return _graphemes.cend();
}

Text::const_reverse_iterator Text::rbegin() const
{
  return _graphemes.crbegin();
}

Text::const_reverse_iterator Text::rend() const
{
  return _graphemes.crend();
}

std::int32_t Text::to_int32(std::string_view const str)
{
  if (str.empty())
  {
    return 0;
  }

  std::int32_t pos {0};
  std::int32_t const len {static_cast<std::int32_t>(str.size())};
  UChar32 ch {0};

  U8_NEXT(str.data(), pos, len, ch);

  // malformed input
  if (ch < 0)
  {
    return 0xfffd;
  }

  return ch;
}

bool Text::is_punct(std::int32_t const ch)
{
  return u_ispunct(ch);
}

bool Text::is_alpha(std::int32_t const ch)
{
  return u_isalpha(ch);
}

} // namespace OB
