#ifndef OB_COLOR_HH
#define OB_COLOR_HH

#include "ob/string.hh"
#include "ob/tty.hh"
namespace aec = OB::Tty::ANSI_Escape_Codes;

#include <string>
#include <regex>
#include <ostream>
#include <unordered_map>

namespace OB
{

class Color
{
  // sgr foreground codes of the 4-bit colours
  // the background code is 10 higher
  inline static std::unordered_map<std::string, int> const names {
    {"black", 30}, {"red", 31}, {"green", 32}, {"yellow", 33},
    {"blue", 34}, {"magenta", 35}, {"cyan", 36}, {"white", 37},
    {"black bright", 90}, {"red bright", 91}, {"green bright", 92}, {"yellow bright", 93},
    {"blue bright", 94}, {"magenta bright", 95}, {"cyan bright", 96}, {"white bright", 97},
  };

public:

  struct Type
  {
    enum value
    {
      bg = 0,
      fg
    };
  };

  Color() = default;

  Color(Type::value const fg) noexcept :
    _fg {static_cast<bool>(fg)}
  {
  }

  Color(std::string const& k, Type::value const fg = Type::value::fg) :
    _fg {static_cast<bool>(fg)}
  {
    key(k);
  }

  friend std::ostream& operator<<(std::ostream& os, Color const& obj)
  {
    os << obj._value;

    return os;
  }

  std::string key() const
  {
    return _key;
  }

  // returns false and keeps the previous value if 'k' is not a colour
  bool key(std::string const& k)
  {
    if (k.empty())
    {
      return false;
    }

    if (k == "clear")
    {
      _value = "";
    }
    else if (k == "reverse")
    {
      _value = aec::reverse;
    }

    // 24-bit colour
    else if (k.at(0) == '#' && OB::String::assert_rx(k,
      std::regex("^#[0-9a-fA-F]{3}(?:[0-9a-fA-F]{3})?$")))
    {
      _value = _fg ? aec::fg_true(k) : aec::bg_true(k);
    }

    // 8-bit colour
    else if (OB::String::assert_rx(k, std::regex("^[0-9]{1,3}$")) &&
      std::stoi(k) <= 255)
    {
      _value = _fg ? aec::fg_256(k) : aec::bg_256(k);
    }

    // 4-bit colour
    else if (auto const it = names.find(k); it != names.end())
    {
      _value = aec::csi + std::to_string(_fg ? it->second : it->second + 10) + "m";
    }

    else
    {
      return false;
    }

    _key = k;

    return true;
  }

  std::string value() const
  {
    return _value;
  }

private:

  bool _fg {true};
  std::string _key {"clear"};
  std::string _value;
}; // Color

} // namespace OB

#endif // OB_COLOR_HH
