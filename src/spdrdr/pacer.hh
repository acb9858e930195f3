#ifndef SPDRDR_PACER_HH
#define SPDRDR_PACER_HH

#include "spdrdr/words.hh"

#include <chrono>
#include <string>
#include <optional>
#include <string_view>

// schedules word advances for a word window
//
// credit is the fraction of an interval already spent on the current word
// it carries partial progress across keystrokes and goes negative after
// punctuation to hold the next word for longer
class Pacing_Engine
{
public:

  using clock = std::chrono::steady_clock;

  enum class State
  {
    paused,
    forward,
    backward,
    frozen,
  };

  enum class Command
  {
    none,
    speed_up,
    speed_down,
    toggle_pause,
    step_forward,
    step_backward,
    begin,
    end,
    quit,
  };

  static int constexpr wpm_min {-1000};
  static int constexpr wpm_max {1000};
  static int constexpr wpm_step {50};

  Pacing_Engine(Word_Window& window, int const wpm, bool const paused,
    clock::time_point const now);

  State state() const;
  bool running() const;
  bool paused() const;

  int wpm() const;
  void set_wpm(int const val);

  double credit() const;

  // seconds per word, empty when frozen
  std::optional<double> interval() const;

  // seconds until the next advance is due, empty when nothing is scheduled
  std::optional<double> timeout() const;

  // as above, less the time already spent on the current word
  std::optional<double> timeout(clock::time_point const now) const;

  // the input poll timed out
  // returns true if the window moved
  bool expire(clock::time_point const now);

  // a key arrived before the timeout
  void interrupt(clock::time_point const now);

  // returns false on quit
  bool apply(Command const cmd, clock::time_point const now);

  // add 'elapsed' seconds of progress without advancing
  void accumulate(double const elapsed);

  // start timing the current word from 'now'
  void restart(clock::time_point const now);

  // credit owed after leaving 'word'
  static double punct_credit(std::string_view const word);

  static std::string str(State const state);

private:

  void advance(clock::time_point const now);
  void toggle_pause(clock::time_point const now);

  Word_Window& _window;

  struct Ctx
  {
    // words per minute, negative reads backwards
    int wpm {500};

    bool paused {true};

    double credit {0.0};

    // start of the current word
    clock::time_point start {};
  } _ctx;
};

#endif // SPDRDR_PACER_HH
