#ifndef OB_TTY_HH
#define OB_TTY_HH

#include <termios.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>

#include <string>

namespace OB::Tty
{

namespace ANSI_Escape_Codes
{

inline std::string const csi {"\x1b["};

inline std::string const cr {"\r"};
inline std::string const space {" "};

// reset all attributes
inline std::string const clear {"\x1b[0m"};
inline std::string const reverse {"\x1b[7m"};

inline std::string const erase_line {"\x1b[2K"};
inline std::string const screen_clear {"\x1b[2J"};
inline std::string const screen_push {"\x1b[?1049h"};
inline std::string const screen_pop {"\x1b[?1049l"};

inline std::string const cursor_hide {"\x1b[?25l"};
inline std::string const cursor_show {"\x1b[?25h"};
inline std::string const cursor_home {"\x1b[H"};

// zero based column and row
std::string cursor_set(std::size_t x, std::size_t y);

// '#rgb' or '#rrggbb'
std::string fg_true(std::string hex);
std::string bg_true(std::string hex);

// '0' to '255'
std::string fg_256(std::string const& x);
std::string bg_256(std::string const& x);

} // namespace ANSI_Escape_Codes

namespace Key
{

enum : char32_t
{
  null = 0,
  enter = 13,
  escape = 27,
  space = 32,

  // outside the unicode range
  up = 0x110000,
  down,
  left,
  right,
  home,
  end,
};

} // namespace Key

constexpr char32_t ctrl_key(char32_t const c)
{
  return c & 0x1f;
}

bool is_term(int const fd);

std::string env_var(std::string const& var);

// width and height of the terminal attached to stdout
void size(std::size_t& width, std::size_t& height);

// saves the terminal attributes of stdin on construction
// and restores them on destruction
class Mode
{
public:

  Mode();
  Mode(Mode const&) = delete;
  Mode& operator=(Mode const&) = delete;
  ~Mode();

  // non-canonical, no echo, no signal keys
  // read returns immediately with whatever is available
  void set_raw();

private:

  termios _old {};
  termios _raw {};
  bool _is_raw {false};
}; // class Mode

// switches stdout to the alternate screen with a hidden cursor
// and switches back on destruction
class Screen
{
public:

  Screen();
  Screen(Screen const&) = delete;
  Screen& operator=(Screen const&) = delete;
  ~Screen();
}; // class Screen

struct Event
{
  enum class Type
  {
    timeout,
    key,
    interrupt,
    resize,
  };

  Type type {Type::timeout};
  char32_t key {Key::null};
}; // struct Event

// multiplexes keyboard input with termination and resize signals
// only one instance may exist at a time
class Input
{
public:

  // reads keys from 'fd'
  explicit Input(int const fd = STDIN_FILENO);
  Input(Input const&) = delete;
  Input& operator=(Input const&) = delete;
  ~Input();

  // timeout in milliseconds, negative blocks until an event arrives
  Event poll(int const timeout);

private:

  char32_t read_key();
  bool read_byte(unsigned char& ch);

  int _fd {STDIN_FILENO};
  int _pipe[2] {-1, -1};
}; // class Input

} // namespace OB::Tty

#endif // OB_TTY_HH
