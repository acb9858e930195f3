#include "ob/tty.hh"

#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <termios.h>
#include <sys/ioctl.h>

#include <cerrno>
#include <cstdlib>
#include <cstddef>
#include <cstdint>

#include <array>
#include <string>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace OB::Tty
{

namespace ANSI_Escape_Codes
{

std::string cursor_set(std::size_t x, std::size_t y)
{
  return csi + std::to_string(y + 1) + ";" + std::to_string(x + 1) + "H";
}

static std::string hex_to_rgb(std::string hex)
{
  if (! hex.empty() && hex.at(0) == '#')
  {
    hex.erase(0, 1);
  }

  // expand the short form
  if (hex.size() == 3)
  {
    hex = std::string {hex.at(0), hex.at(0), hex.at(1), hex.at(1), hex.at(2), hex.at(2)};
  }

  if (hex.size() != 6)
  {
    throw std::invalid_argument("invalid hex colour '" + hex + "'");
  }

  return
    std::to_string(std::stoi(hex.substr(0, 2), nullptr, 16)) + ";" +
    std::to_string(std::stoi(hex.substr(2, 2), nullptr, 16)) + ";" +
    std::to_string(std::stoi(hex.substr(4, 2), nullptr, 16));
}

std::string fg_true(std::string hex)
{
  return csi + "38;2;" + hex_to_rgb(std::move(hex)) + "m";
}

std::string bg_true(std::string hex)
{
  return csi + "48;2;" + hex_to_rgb(std::move(hex)) + "m";
}

std::string fg_256(std::string const& x)
{
  return csi + "38;5;" + x + "m";
}

std::string bg_256(std::string const& x)
{
  return csi + "48;5;" + x + "m";
}

} // namespace ANSI_Escape_Codes

namespace
{

// write end of the signal pipe, read by the signal handler
volatile sig_atomic_t sig_fd {-1};

std::array<int, 5> constexpr sig_list {SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGWINCH};
std::array<struct sigaction, 5> sig_prev {};

void on_signal(int sig)
{
  int const err {errno};
  unsigned char const val {static_cast<unsigned char>(sig)};

  if (sig_fd != -1)
  {
    // a full pipe already holds a pending event
    auto const n = write(sig_fd, &val, 1);
    static_cast<void>(n);
  }

  errno = err;
}

void set_nonblock(int fd)
{
  int const flags {fcntl(fd, F_GETFL)};

  if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1 ||
    fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
  {
    throw std::system_error(errno, std::generic_category(), "fcntl");
  }
}

} // namespace

bool is_term(int const fd)
{
  return isatty(fd);
}

std::string env_var(std::string const& var)
{
  if (char const* val = std::getenv(var.c_str()))
  {
    return val;
  }

  return {};
}

void size(std::size_t& width, std::size_t& height)
{
  winsize w {};

  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == -1)
  {
    throw std::system_error(errno, std::generic_category(), "ioctl");
  }

  width = w.ws_col;
  height = w.ws_row;
}

Mode::Mode()
{
  if (tcgetattr(STDIN_FILENO, &_old) == -1)
  {
    throw std::system_error(errno, std::generic_category(), "tcgetattr");
  }

  _raw = _old;
  _raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
  _raw.c_cflag |= static_cast<tcflag_t>(CS8);
  _raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
  _raw.c_cc[VMIN] = 0;
  _raw.c_cc[VTIME] = 0;
}

Mode::~Mode()
{
  if (_is_raw)
  {
    // nothing left to report to if the terminal is gone
    static_cast<void>(tcsetattr(STDIN_FILENO, TCSAFLUSH, &_old));
  }
}

void Mode::set_raw()
{
  if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &_raw) == -1)
  {
    throw std::system_error(errno, std::generic_category(), "tcsetattr");
  }

  _is_raw = true;
}

Screen::Screen()
{
  std::cout
  << ANSI_Escape_Codes::cursor_hide
  << ANSI_Escape_Codes::screen_push
  << ANSI_Escape_Codes::screen_clear
  << ANSI_Escape_Codes::cursor_home
  << std::flush;
}

Screen::~Screen()
{
  std::cout
  << ANSI_Escape_Codes::clear
  << ANSI_Escape_Codes::screen_pop
  << ANSI_Escape_Codes::cursor_show
  << std::flush;
}

Input::Input(int const fd) :
  _fd {fd}
{
  if (sig_fd != -1)
  {
    throw std::logic_error("only one input poller may exist at a time");
  }

  if (pipe(_pipe) == -1)
  {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }

  try
  {
    set_nonblock(_pipe[0]);
    set_nonblock(_pipe[1]);
  }
  catch (std::system_error const&)
  {
    close(_pipe[0]);
    close(_pipe[1]);

    throw;
  }

  sig_fd = _pipe[1];

  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);

  for (std::size_t i = 0; i < sig_list.size(); ++i)
  {
    if (sigaction(sig_list.at(i), &sa, &sig_prev.at(i)) == -1)
    {
      int const err {errno};

      while (i-- > 0)
      {
        sigaction(sig_list.at(i), &sig_prev.at(i), nullptr);
      }

      sig_fd = -1;
      close(_pipe[0]);
      close(_pipe[1]);

      throw std::system_error(err, std::generic_category(), "sigaction");
    }
  }
}

Input::~Input()
{
  for (std::size_t i = 0; i < sig_list.size(); ++i)
  {
    sigaction(sig_list.at(i), &sig_prev.at(i), nullptr);
  }

  sig_fd = -1;

  close(_pipe[0]);
  close(_pipe[1]);
}

Event Input::poll(int const timeout)
{
  std::array<pollfd, 2> fds {{
    {_fd, POLLIN, 0},
    {_pipe[0], POLLIN, 0},
  }};

  int const n {::poll(fds.data(), fds.size(), timeout)};

  if (n == -1)
  {
    // woken by a signal, its byte is waiting in the pipe
    if (errno == EINTR)
    {
      return {};
    }

    throw std::system_error(errno, std::generic_category(), "poll");
  }

  if (n == 0)
  {
    return {};
  }

  if (fds.at(1).revents & POLLIN)
  {
    Event ev {Event::Type::resize};

    unsigned char sig {0};
    while (read(_pipe[0], &sig, 1) == 1)
    {
      if (sig != SIGWINCH)
      {
        ev.type = Event::Type::interrupt;
      }
    }

    return ev;
  }

  if (fds.at(0).revents & POLLIN)
  {
    auto const key = read_key();

    if (key == ctrl_key('c'))
    {
      return {Event::Type::interrupt, key};
    }

    if (key == Key::null)
    {
      if (fds.at(0).revents & (POLLHUP | POLLERR))
      {
        return {Event::Type::interrupt, Key::null};
      }

      return {};
    }

    return {Event::Type::key, key};
  }

  if (fds.at(0).revents & (POLLHUP | POLLERR | POLLNVAL))
  {
    // the terminal went away
    return {Event::Type::interrupt, Key::null};
  }

  return {};
}

bool Input::read_byte(unsigned char& ch)
{
  auto const n = read(_fd, &ch, 1);

  if (n == 1)
  {
    return true;
  }

  if (n == -1 && errno != EAGAIN && errno != EINTR)
  {
    throw std::system_error(errno, std::generic_category(), "read");
  }

  return false;
}

char32_t Input::read_key()
{
  unsigned char ch {0};

  if (! read_byte(ch))
  {
    return Key::null;
  }

  // escape sequence
  if (ch == Key::escape)
  {
    unsigned char seq {0};

    if (! read_byte(seq) || (seq != '[' && seq != 'O'))
    {
      return Key::escape;
    }

    unsigned char code {0};

    if (! read_byte(code))
    {
      return Key::escape;
    }

    switch (code)
    {
      case 'A': return Key::up;
      case 'B': return Key::down;
      case 'C': return Key::right;
      case 'D': return Key::left;
      case 'H': return Key::home;
      case 'F': return Key::end;
      default: break;
    }

    // numbered sequence terminated by '~'
    if (seq == '[' && code >= '0' && code <= '9')
    {
      std::string num {static_cast<char>(code)};
      bool modifier {false};

      while (read_byte(code))
      {
        if (code == '~')
        {
          if (num == "1" || num == "7")
          {
            return Key::home;
          }

          if (num == "4" || num == "8")
          {
            return Key::end;
          }

          return Key::null;
        }

        // only the first parameter names the key, as in 'ESC [ 1 ; 5 ~'
        if (code == ';')
        {
          modifier = true;
        }
        else if (code < '0' || code > '9')
        {
          break;
        }
        else if (! modifier)
        {
          num += static_cast<char>(code);
        }
      }

      // unterminated, the rest of it was consumed
      return Key::null;
    }

    // unknown sequence, dropped whole
    return Key::null;
  }

  if (ch < 0x80)
  {
    return ch;
  }

  // utf-8 lead byte
  int len {1};
  if (ch >= 0xf0)
  {
    len = 4;
  }
  else if (ch >= 0xe0)
  {
    len = 3;
  }
  else if (ch >= 0xc0)
  {
    len = 2;
  }

  char32_t val {static_cast<char32_t>(ch & (0xff >> (len + 1)))};

  for (int i = 1; i < len; ++i)
  {
    unsigned char cont {0};

    if (! read_byte(cont))
    {
      return Key::null;
    }

    val = (val << 6) | (cont & 0x3f);
  }

  return val;
}

} // namespace OB::Tty
