#include "spdrdr/log.hh"

#include <cstddef>

#include <chrono>
#include <deque>
#include <string>
#include <sstream>
#include <iomanip>
#include <utility>

Debug_Log::Debug_Log(bool const enabled, std::size_t const limit) :
  _enabled {enabled},
  _limit {limit},
  _start {std::chrono::steady_clock::now()}
{
}

bool Debug_Log::enabled() const
{
  return _enabled;
}

void Debug_Log::enabled(bool const val)
{
  _enabled = val;
}

std::size_t Debug_Log::size() const
{
  return _lines.size();
}

std::string Debug_Log::str() const
{
  std::ostringstream ss;

  if (_dropped)
  {
    ss << "[...] " << _dropped << " earlier lines dropped\n";
  }

  for (auto const& e : _lines)
  {
    ss << e << "\n";
  }

  return ss.str();
}

void Debug_Log::push(std::string line)
{
  if (_limit == 0)
  {
    return;
  }

  auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - _start).count();

  std::ostringstream ss;
  ss
  << "[" << std::setw(6) << ms / 1000 << "." << std::setw(3) << std::setfill('0')
  << ms % 1000 << "] " << line;

  if (_lines.size() == _limit)
  {
    _lines.pop_front();
    ++_dropped;
  }

  _lines.emplace_back(ss.str());
}
