#ifndef SPDRDR_TUI_HH
#define SPDRDR_TUI_HH

#include "spdrdr/words.hh"
#include "spdrdr/pacer.hh"
#include "spdrdr/log.hh"

#include "ob/color.hh"
#include "ob/timer.hh"
#include "ob/tty.hh"

#include <cstddef>

#include <string>
#include <sstream>
#include <utility>
#include <optional>

#include <filesystem>
namespace fs = std::filesystem;

class Tui
{
public:

  // why the event loop ended and where the reader was
  struct Exit
  {
    enum class Reason
    {
      quit,
      interrupt,
    };

    Reason reason {Reason::quit};
    std::size_t index {0};
  };

  // bounds of the context chunk size
  static std::size_t constexpr chunk_min {1};
  static std::size_t constexpr chunk_max {1000};

  Tui(Word_Window& window, Debug_Log& log);

  Tui& file(std::string const& name);

  Tui& wpm(int const val);
  int wpm() const;

  Tui& chunk(std::size_t const val);
  std::size_t chunk() const;

  void load_config(fs::path const& path);

  // empty when the command succeeded without output
  // otherwise 'first' is false on error and 'second' holds the message
  std::optional<std::pair<bool, std::string>> command(std::string const& input);

  Exit run();

  static Pacing_Engine::Command key_command(char32_t const key);

private:

  Exit event_loop(OB::Tty::Input& input);
  bool screen_size();

  void clear();
  void refresh();

  void draw();
  void draw_border_top();
  void draw_word();
  void draw_border_bottom();
  void draw_chunk();
  void draw_progress_bar();
  void draw_status();

  void sync_timer(Pacing_Engine::clock::time_point const now);

  Word_Window& _window;
  Pacing_Engine _pacer;
  Debug_Log& _log;

  // reading time, runs while playing
  OB::Timer _timer;

  struct Ctx
  {
    // file name shown in the status bar
    std::string file {"*stdin*"};

    // current terminal size
    std::size_t width {0};
    std::size_t height {0};

    // minimum terminal size
    std::size_t width_min {20};
    std::size_t height_min {6};

    // row of the current word
    std::size_t row {0};

    // number of words in the context chunk
    std::size_t chunk {40};

    // output buffer
    std::ostringstream buf;

    struct Style
    {
      OB::Color word {OB::Color::Type::fg};
      OB::Color focus {"red", OB::Color::Type::fg};
      OB::Color punct {"white bright", OB::Color::Type::fg};
      OB::Color context {"black bright", OB::Color::Type::fg};
      OB::Color current {"reverse", OB::Color::Type::fg};
      OB::Color status {"reverse", OB::Color::Type::bg};
      OB::Color border {"black bright", OB::Color::Type::fg};
    } style;

    struct Sym
    {
      std::string border {"-"};
      std::string border_top_mark {"v"};
      std::string border_bottom_mark {"^"};
      std::string progress_bar {"_"};
      std::string progress_fill {"="};
    } sym;
  } _ctx;
};

#endif // SPDRDR_TUI_HH
