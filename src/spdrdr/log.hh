#ifndef SPDRDR_LOG_HH
#define SPDRDR_LOG_HH

#include <cstddef>

#include <chrono>
#include <deque>
#include <string>
#include <sstream>

// keeps the most recent debug lines in memory
// the screen belongs to the reader while it runs, so the lines are
// written out once the terminal has been restored
class Debug_Log
{
public:

  explicit Debug_Log(bool const enabled = false, std::size_t const limit = 512);

  bool enabled() const;
  void enabled(bool const val);

  template<typename... Args>
  void operator()(Args const&... args)
  {
    if (! _enabled)
    {
      return;
    }

    std::ostringstream ss;
    (ss << ... << args);
    push(ss.str());
  }

  std::size_t size() const;

  // one line per entry, oldest first
  std::string str() const;

private:

  void push(std::string line);

  bool _enabled {false};
  std::size_t _limit {512};
  std::size_t _dropped {0};
  std::chrono::steady_clock::time_point const _start;
  std::deque<std::string> _lines;
};

#endif // SPDRDR_LOG_HH
