#ifndef OB_TEXT_HH
#define OB_TEXT_HH

#include <cstddef>
#include <cstdint>

#include <string_view>
#include <vector>

namespace OB
{

// a utf-8 string split into grapheme clusters
// each grapheme is a view into the source string, which must outlive the object
class Text
{
public:

  struct Grapheme
  {
    // byte offset into the source string
    std::size_t bytes {0};

    // display columns, 2 for wide and fullwidth characters
    std::size_t cols {0};

    std::string_view str;
  };

  using const_iterator = std::vector<Grapheme>::const_iterator;
  using const_reverse_iterator = std::vector<Grapheme>::const_reverse_iterator;

  Text() = default;
  Text(std::string_view const str);

  Text& str(std::string_view const str);
  std::string_view str() const;

  Grapheme const& at(std::size_t const pos) const;

  bool empty() const;

  // number of graphemes
  std::size_t size() const;

  std::size_t bytes() const;

  // display columns of the whole string
  std::size_t cols() const;

  // display columns of the first 'size' graphemes
  std::size_t cols(std::size_t const size) const;

  const_iterator begin() const;
  const_iterator end() const;
  const_reverse_iterator rbegin() const;
  const_reverse_iterator rend() const;

  // first code point of 'str', 0 if empty
  static std::int32_t to_int32(std::string_view const str);

  static bool is_punct(std::int32_t const ch);
  static bool is_alpha(std::int32_t const ch);

private:

  std::string_view _src;
  std::vector<Grapheme> _graphemes;
  std::size_t _cols {0};
}; // class Text

} // namespace OB

#endif // OB_TEXT_HH
