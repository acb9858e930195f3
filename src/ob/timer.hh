#ifndef OB_TIMER_HH
#define OB_TIMER_HH

#include <chrono>
#include <string>

namespace OB
{

// accumulates running time across start/stop pairs
template<typename Clock>
class Basic_Timer
{
public:

  using clock = Clock;

  Basic_Timer() = default;

  operator bool() const
  {
    return _is_running;
  }

  Basic_Timer& start(typename clock::time_point const now = clock::now())
  {
    if (! _is_running)
    {
      _is_running = true;
      _start = now;
    }

    return *this;
  }

  Basic_Timer& stop(typename clock::time_point const now = clock::now())
  {
    if (_is_running)
    {
      update(now);
      _is_running = false;
    }

    return *this;
  }

  Basic_Timer& reset()
  {
    _is_running = false;
    _total = {};

    return *this;
  }

  template<typename T>
  T time(typename clock::time_point const now = clock::now())
  {
    if (_is_running)
    {
      update(now);
    }

    return std::chrono::duration_cast<T>(_total);
  }

  std::string str(typename clock::time_point const now = clock::now())
  {
    return seconds_to_string(time<std::chrono::seconds>(now).count());
  }

  // largest units first, for example '1h:0s' or '2D:3h:4m:5s'
  static std::string seconds_to_string(long int sec)
  {
    struct Unit
    {
      long int size;
      char sym;
    };

    Unit constexpr units[] {{86400, 'D'}, {3600, 'h'}, {60, 'm'}};

    std::string res;

    for (auto const& e : units)
    {
      if (sec >= e.size)
      {
        res += std::to_string(sec / e.size) + e.sym + ":";
        sec %= e.size;
      }
    }

    return res + std::to_string(sec) + "s";
  }

private:

  void update(typename clock::time_point const now)
  {
    if (now > _start)
    {
      _total += (now - _start);
    }

    _start = now;
  }

  bool _is_running {false};
  typename clock::time_point _start {};
  typename clock::duration _total {};
}; // class Basic_Timer

using Timer = Basic_Timer<std::chrono::steady_clock>;

} // namespace OB

#endif // OB_TIMER_HH
