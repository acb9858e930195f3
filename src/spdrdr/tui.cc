#include "spdrdr/tui.hh"

#include "ob/string.hh"
#include "ob/text.hh"
#include "ob/tty.hh"
namespace aec = OB::Tty::ANSI_Escape_Codes;

#include <cmath>
#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <sstream>
#include <fstream>
#include <iostream>
#include <vector>
#include <regex>
#include <utility>
#include <optional>
#include <algorithm>
#include <stdexcept>

#include <filesystem>
namespace fs = std::filesystem;

namespace
{

// the leading graphemes of 'text' that fit in 'cols' display columns
std::string_view fit(OB::Text const& text, std::size_t const cols)
{
  std::size_t used {0};
  std::size_t bytes {0};

  for (auto const& e : text)
  {
    if (used + e.cols > cols)
    {
      break;
    }

    used += e.cols;
    bytes += e.str.size();
  }

  return text.str().substr(0, bytes);
}

} // namespace

Tui::Tui(Word_Window& window, Debug_Log& log) :
  _window {window},
  _pacer {window, 500, false, Pacing_Engine::clock::now()},
  _log {log}
{
}

Tui& Tui::file(std::string const& name)
{
  _ctx.file = name;

  return *this;
}

Tui& Tui::wpm(int const val)
{
  _pacer.set_wpm(val);

  return *this;
}

int Tui::wpm() const
{
  return _pacer.wpm();
}

Tui& Tui::chunk(std::size_t const val)
{
  if (val < chunk_min || val > chunk_max)
  {
    throw std::invalid_argument("chunk size is out of range <" +
      std::to_string(chunk_min) + "-" + std::to_string(chunk_max) + ">");
  }

  _ctx.chunk = val;

  return *this;
}

std::size_t Tui::chunk() const
{
  return _ctx.chunk;
}

void Tui::load_config(fs::path const& path)
{
  // ignore config if path equals "NONE"
  if (path == "NONE")
  {
    return;
  }

  // buffer for error output
  std::ostringstream err;

  if (! path.empty() && fs::exists(path))
  {
    std::ifstream file {path};

    if (file.is_open())
    {
      std::string line;
      std::size_t lnum {0};

      while (std::getline(file, line))
      {
        // increase line number
        ++lnum;

        // trim leading and trailing whitespace
        line = OB::String::trim(line);

        // ignore empty line or comment
        if (line.empty() || line.at(0) == '#')
        {
          continue;
        }

        if (auto const res = command(line))
        {
          if (! res.value().first)
          {
            // source:line: level: info
            err << path.string() << ":" << lnum << ": " << res.value().second << "\n";
          }
        }
      }
    }
    else
    {
      err << "error: could not open config file '" << path.string() << "'\n";
    }
  }

  _log("config '", path.string(), "' wpm ", wpm(), " chunk ", chunk());

  if (! err.str().empty())
  {
    std::cerr << err.str() << "Press ENTER to continue";

    std::string line;
    if (! std::getline(std::cin, line))
    {
      throw std::runtime_error("aborted by user");
    }
  }
}

std::optional<std::pair<bool, std::string>> Tui::command(std::string const& input)
{
  auto const keys = OB::String::split(input, " ");

  if (keys.empty())
  {
    return {};
  }

  // store the matches returned from OB::String::match
  std::optional<std::vector<std::string>> match_opt;

  if (keys.at(0) == "wpm" && (match_opt = OB::String::match(input,
    std::regex("^wpm(?:\\s+([-+]?[0-9]+))?$"))))
  {
    auto const match = match_opt.value().at(1);

    if (match.empty())
    {
      return std::make_pair(true, "wpm " + std::to_string(wpm()));
    }

    auto const val = OB::String::to_int(match);

    if (! val || val.value() < Pacing_Engine::wpm_min || val.value() > Pacing_Engine::wpm_max)
    {
      return std::make_pair(false, "error: value '" + match + "' is out of range <-1000-1000>");
    }

    wpm(val.value());
  }

  else if (keys.at(0) == "chunk" && (match_opt = OB::String::match(input,
    std::regex("^chunk(?:\\s+([0-9]+))?$"))))
  {
    auto const match = match_opt.value().at(1);

    if (match.empty())
    {
      return std::make_pair(true, "chunk " + std::to_string(chunk()));
    }

    auto const val = OB::String::to_int(match);

    if (! val || val.value() < static_cast<int>(chunk_min) ||
      val.value() > static_cast<int>(chunk_max))
    {
      return std::make_pair(false, "error: value '" + match + "' is out of range <" +
        std::to_string(chunk_min) + "-" + std::to_string(chunk_max) + ">");
    }

    chunk(static_cast<std::size_t>(val.value()));
  }

  else if (keys.at(0) == "style" && (match_opt = OB::String::match(input,
    std::regex("^style\\s+([a-z]+)\\s+([^\\r]+)$"))))
  {
    auto const name = match_opt.value().at(1);
    auto const value = OB::String::trim(match_opt.value().at(2));

    OB::Color* color {nullptr};

    if (name == "word")
    {
      color = &_ctx.style.word;
    }
    else if (name == "focus")
    {
      color = &_ctx.style.focus;
    }
    else if (name == "punct")
    {
      color = &_ctx.style.punct;
    }
    else if (name == "context")
    {
      color = &_ctx.style.context;
    }
    else if (name == "current")
    {
      color = &_ctx.style.current;
    }
    else if (name == "status")
    {
      color = &_ctx.style.status;
    }
    else if (name == "border")
    {
      color = &_ctx.style.border;
    }
    else
    {
      return std::make_pair(false, "error: unknown style '" + name + "'");
    }

    if (! color->key(value))
    {
      return std::make_pair(false, "error: invalid colour '" + value + "'");
    }
  }

  else
  {
    return std::make_pair(false, "error: unknown command '" + input + "'");
  }

  return {};
}

Pacing_Engine::Command Tui::key_command(char32_t const key)
{
  using Command = Pacing_Engine::Command;

  switch (key)
  {
    // quit
    case 'q': case 'Q':
      return Command::quit;

    // toggle play
    case OB::Tty::Key::space: case 'p':
      return Command::toggle_pause;

    // increase wpm
    case 'k': case '+': case OB::Tty::Key::up:
      return Command::speed_up;

    // decrease wpm
    case 'j': case '-': case OB::Tty::Key::down:
      return Command::speed_down;

    // move index forwards
    case 'l': case OB::Tty::Key::right:
      return Command::step_forward;

    // move index backwards
    case 'h': case OB::Tty::Key::left:
      return Command::step_backward;

    // goto beginning
    case 'g': case OB::Tty::Key::home:
      return Command::begin;

    // goto end
    case 'G': case OB::Tty::Key::end:
      return Command::end;

    default:
      return Command::none;
  }
}

Tui::Exit Tui::run()
{
  OB::Tty::Mode mode;
  OB::Tty::Input input;
  OB::Tty::Screen screen;

  // set terminal mode to raw
  mode.set_raw();

  auto const now = Pacing_Engine::clock::now();
  _pacer.restart(now);
  sync_timer(now);

  _log("start at ", _window.index(), "/", _window.size(), " wpm ", wpm(),
    " chunk ", chunk());

  // start the event loop
  return event_loop(input);
}

Tui::Exit Tui::event_loop(OB::Tty::Input& input)
{
  using Type = OB::Tty::Event::Type;

  while (true)
  {
    // get the terminal width and height
    OB::Tty::size(_ctx.width, _ctx.height);

    if (screen_size())
    {
      _ctx.row = (_ctx.height - 2) / 2;

      // render new content
      clear();
      draw();
      refresh();
    }
    else if (_pacer.running())
    {
      _pacer.apply(Pacing_Engine::Command::toggle_pause, Pacing_Engine::clock::now());
      _log("paused, terminal too small");
    }

    // wait for the next word or a key, whichever comes first
    int wait {-1};
    if (auto const timeout = _pacer.timeout(Pacing_Engine::clock::now()))
    {
      wait = static_cast<int>(std::ceil(timeout.value() * 1000.0));
    }

    auto const event = input.poll(wait);
    auto const now = Pacing_Engine::clock::now();

    switch (event.type)
    {
      case Type::timeout:
      {
        auto const index = _window.index();
        auto const was_running = _pacer.running();

        if (_pacer.expire(now))
        {
          _log("advance ", index, " -> ", _window.index(), " '", _window.word(),
            "' credit ", _pacer.credit());
        }
        else if (was_running && _pacer.paused())
        {
          _log("paused at boundary ", _window.index());
        }

        break;
      }

      case Type::resize:
      {
        break;
      }

      case Type::interrupt:
      {
        _timer.stop(now);
        _log("interrupt at ", _window.index());

        return {Exit::Reason::interrupt, _window.index()};
      }

      case Type::key:
      {
        auto const cmd = key_command(event.key);
        _pacer.interrupt(now);

        _log("key ", static_cast<std::uint32_t>(event.key), " command ",
          static_cast<int>(cmd), " credit ", _pacer.credit());

        if (! _pacer.apply(cmd, now))
        {
          _timer.stop(now);
          _log("quit at ", _window.index());

          return {Exit::Reason::quit, _window.index()};
        }

        if (cmd == Pacing_Engine::Command::toggle_pause ||
          cmd == Pacing_Engine::Command::speed_up ||
          cmd == Pacing_Engine::Command::speed_down)
        {
          _log(Pacing_Engine::str(_pacer.state()), " ", wpm(), "wpm");
        }

        break;
      }
    }

    sync_timer(now);
  }
}

void Tui::sync_timer(Pacing_Engine::clock::time_point const now)
{
  if (_pacer.running())
  {
    _timer.start(now);
  }
  else
  {
    _timer.stop(now);
  }
}

void Tui::clear()
{
  for (std::size_t i = 0; i < _ctx.height; ++i)
  {
    _ctx.buf
    << aec::cursor_set(0, i)
    << aec::clear
    << aec::erase_line;
  }

  _ctx.buf
  << aec::cursor_home;
}

void Tui::refresh()
{
  // output buffer to screen
  std::cout
  << _ctx.buf.str()
  << std::flush;

  // clear output buffer
  _ctx.buf.str("");
}

void Tui::draw()
{
  draw_border_top();
  draw_word();
  draw_border_bottom();
  draw_chunk();
  draw_progress_bar();
  draw_status();
}

void Tui::draw_border_top()
{
  if (_ctx.row == 0)
  {
    return;
  }

  _ctx.buf
  << aec::cursor_set(0, _ctx.row - 1)
  << _ctx.style.border
  << OB::String::repeat(_ctx.width, _ctx.sym.border)
  << aec::cursor_set(_ctx.width / 2, _ctx.row - 1)
  << _ctx.sym.border_top_mark
  << aec::clear;
}

void Tui::draw_word()
{
  auto const& word = _window.word();
  OB::Text const text {word};

  // align the focus point with the centre column
  auto const focus = focus_point(word);
  auto const prefix = text.cols(focus);
  auto const center = _ctx.width / 2;
  std::size_t cols {prefix < center ? center - prefix : 0};

  _ctx.buf
  << aec::cursor_set(cols, _ctx.row);

  for (std::size_t i = 0; i < text.size(); ++i)
  {
    auto const& e = text.at(i);

    cols += e.cols;
    if (cols > _ctx.width)
    {
      break;
    }

    if (i == focus)
    {
      _ctx.buf << _ctx.style.focus;
    }
    else if (OB::Text::is_punct(OB::Text::to_int32(e.str)))
    {
      _ctx.buf << _ctx.style.punct;
    }
    else
    {
      _ctx.buf << _ctx.style.word;
    }

    _ctx.buf
    << e.str
    << aec::clear;
  }
}

void Tui::draw_border_bottom()
{
  _ctx.buf
  << aec::cursor_set(0, _ctx.row + 1)
  << _ctx.style.border
  << OB::String::repeat(_ctx.width, _ctx.sym.border)
  << aec::cursor_set(_ctx.width / 2, _ctx.row + 1)
  << _ctx.sym.border_bottom_mark
  << aec::clear;
}

void Tui::draw_chunk()
{
  // rows between the bottom border and the progress bar
  auto const first = _ctx.row + 3;
  auto const last = _ctx.height - 3;

  if (first > last)
  {
    return;
  }

  auto const rows = last - first + 1;
  std::size_t const margin {2};
  auto const width = _ctx.width - (margin * 2);

  auto const chunk = _window.window_around(_ctx.chunk);

  struct Word
  {
    std::string_view str;
    bool current {false};
  };
  std::vector<std::vector<Word>> lines (1);
  std::size_t line_cols {0};
  std::size_t current_line {0};

  // wrap words to the available width
  for (std::size_t i = 0; i < chunk.words.size(); ++i)
  {
    OB::Text const text {chunk.words.at(i)};
    auto const str = fit(text, width);
    auto const cols = std::min(text.cols(), width);

    if (! lines.back().empty() && line_cols + 1 + cols > width)
    {
      lines.emplace_back();
      line_cols = 0;
    }

    line_cols += (lines.back().empty() ? 0 : 1) + cols;
    lines.back().push_back({str, i == chunk.offset});

    if (i == chunk.offset)
    {
      current_line = lines.size() - 1;
    }
  }

  // keep the current word on screen
  std::size_t const begin {current_line >= rows ? current_line - rows + 1 : 0};

  for (std::size_t i = begin; i < lines.size() && i - begin < rows; ++i)
  {
    _ctx.buf
    << aec::cursor_set(margin, first + i - begin);

    bool space {false};
    for (auto const& e : lines.at(i))
    {
      if (space)
      {
        _ctx.buf << aec::space;
      }
      space = true;

      _ctx.buf
      << (e.current ? _ctx.style.current : _ctx.style.context)
      << e.str
      << aec::clear;
    }
  }
}

void Tui::draw_progress_bar()
{
  auto const [pos, total] = _window.progress();

  _ctx.buf
  << aec::cursor_set(0, _ctx.height - 2)
  << _ctx.style.border
  << OB::String::repeat(_ctx.width, _ctx.sym.progress_bar)
  << aec::cr
  << OB::String::repeat(pos * _ctx.width / total, _ctx.sym.progress_fill)
  << aec::clear;
}

void Tui::draw_status()
{
  auto const [pos, total] = _window.progress();

  std::string const mode {" " + Pacing_Engine::str(_pacer.state()) + " "};

  std::ostringstream ss;
  ss
  << " " << _timer.str()
  << " " << wpm() << "wpm"
  << " " << pos << "/" << total
  << " " << percent(pos, total) << "% ";
  auto const stats = ss.str();

  _ctx.buf
  << aec::cursor_set(0, _ctx.height - 1);

  // not enough room for the mode and file name
  if (mode.size() + stats.size() + 2 > _ctx.width)
  {
    _ctx.buf
    << _ctx.style.status
    << stats.substr(0, _ctx.width)
    << aec::clear;

    return;
  }

  auto const room = _ctx.width - mode.size() - stats.size() - 2;

  OB::Text const name {_ctx.file};
  std::string file;

  if (name.cols() <= room)
  {
    file = _ctx.file + OB::String::repeat(room - name.cols(), aec::space);
  }
  else
  {
    // keep the tail of the file name
    std::size_t cols {1};
    std::size_t bytes {0};

    for (auto it = name.rbegin(); it != name.rend(); ++it)
    {
      if (cols + it->cols > room)
      {
        break;
      }

      cols += it->cols;
      bytes += it->str.size();
    }

    file = "<" + std::string(name.str().substr(name.bytes() - bytes)) +
      OB::String::repeat(room - cols, aec::space);
  }

  _ctx.buf
  << _ctx.style.status
  << mode
  << aec::clear
  << aec::space
  << file
  << aec::space
  << _ctx.style.status
  << stats
  << aec::clear;
}

bool Tui::screen_size()
{
  bool width_invalid {_ctx.width < _ctx.width_min};
  bool height_invalid {_ctx.height < _ctx.height_min};

  if (! width_invalid && ! height_invalid)
  {
    return true;
  }

  clear();

  _ctx.buf
  << "Error:";

  if (width_invalid)
  {
    _ctx.buf
    << " width "
    << _ctx.width
    << " (min "
    << _ctx.width_min
    << ")";
  }

  if (height_invalid)
  {
    _ctx.buf
    << " height "
    << _ctx.height
    << " (min "
    << _ctx.height_min
    << ")";
  }

  _ctx.buf
  << aec::clear;

  refresh();

  return false;
}
