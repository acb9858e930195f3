#include "spdrdr/pacer.hh"

#include "ob/text.hh"

#include <cmath>
#include <cstdint>

#include <chrono>
#include <string>
#include <optional>
#include <string_view>
#include <algorithm>

Pacing_Engine::Pacing_Engine(Word_Window& window, int const wpm, bool const paused,
  clock::time_point const now) :
  _window {window}
{
  set_wpm(wpm);
  _ctx.paused = paused;
  restart(now);
}

Pacing_Engine::State Pacing_Engine::state() const
{
  if (_ctx.paused)
  {
    return State::paused;
  }

  if (_ctx.wpm > 0)
  {
    return State::forward;
  }

  if (_ctx.wpm < 0)
  {
    return State::backward;
  }

  return State::frozen;
}

bool Pacing_Engine::running() const
{
  return ! _ctx.paused && _ctx.wpm != 0;
}

bool Pacing_Engine::paused() const
{
  return _ctx.paused;
}

int Pacing_Engine::wpm() const
{
  return _ctx.wpm;
}

void Pacing_Engine::set_wpm(int const val)
{
  _ctx.wpm = std::clamp(val, wpm_min, wpm_max);
}

double Pacing_Engine::credit() const
{
  return _ctx.credit;
}

std::optional<double> Pacing_Engine::interval() const
{
  if (_ctx.wpm == 0)
  {
    return {};
  }

  return std::abs(60.0 / _ctx.wpm);
}

std::optional<double> Pacing_Engine::timeout() const
{
  if (! running())
  {
    return {};
  }

  // an overdue word is shown at once
  if (_ctx.credit >= 1.0)
  {
    return 0.0;
  }

  return std::abs(interval().value() * (1.0 - _ctx.credit));
}

std::optional<double> Pacing_Engine::timeout(clock::time_point const now) const
{
  auto const wait = timeout();

  if (! wait)
  {
    return {};
  }

  auto const elapsed = std::chrono::duration<double>(now - _ctx.start).count();

  return std::max(0.0, wait.value() - elapsed);
}

bool Pacing_Engine::expire(clock::time_point const now)
{
  if (! running())
  {
    return false;
  }

  auto const elapsed = std::chrono::duration<double>(now - _ctx.start).count();

  // the poll can return slightly early
  if (_ctx.credit + elapsed / interval().value() < 1.0)
  {
    return false;
  }

  auto const index = _window.index();
  advance(now);

  return _window.index() != index;
}

void Pacing_Engine::interrupt(clock::time_point const now)
{
  if (running())
  {
    accumulate(std::chrono::duration<double>(now - _ctx.start).count());
  }

  restart(now);
}

bool Pacing_Engine::apply(Command const cmd, clock::time_point const now)
{
  switch (cmd)
  {
    case Command::quit:
    {
      return false;
    }

    case Command::speed_up:
    {
      set_wpm(_ctx.wpm + wpm_step);

      break;
    }

    case Command::speed_down:
    {
      set_wpm(_ctx.wpm - wpm_step);

      break;
    }

    case Command::toggle_pause:
    {
      toggle_pause(now);

      break;
    }

    case Command::step_forward:
    {
      if (! running())
      {
        _window.advance();
      }

      break;
    }

    case Command::step_backward:
    {
      if (! running())
      {
        _window.retreat();
      }

      break;
    }

    case Command::begin:
    {
      if (! running())
      {
        _window.begin();
      }

      break;
    }

    case Command::end:
    {
      if (! running())
      {
        _window.end();
      }

      break;
    }

    case Command::none:
    {
      break;
    }
  }

  return true;
}

void Pacing_Engine::accumulate(double const elapsed)
{
  if (auto const val = interval())
  {
    _ctx.credit += elapsed / val.value();
  }
}

double Pacing_Engine::punct_credit(std::string_view const word)
{
  OB::Text const text {word};

  if (text.empty())
  {
    return 0.0;
  }

  auto const ch = OB::Text::to_int32(text.rbegin()->str);

  switch (ch)
  {
    case U'!': case U'?': case U'.':
    case U';': case U':':
      return -1.0;

    default:
      break;
  }

  if (! OB::Text::is_alpha(ch))
  {
    return -0.5;
  }

  return 0.0;
}

std::string Pacing_Engine::str(State const state)
{
  switch (state)
  {
    case State::paused: return "PAUSE";
    case State::forward: return "PLAY";
    case State::backward: return "REVERSE";
    case State::frozen: return "FROZEN";
  }

  return {};
}

void Pacing_Engine::restart(clock::time_point const now)
{
  _ctx.start = now;
}

void Pacing_Engine::advance(clock::time_point const now)
{
  // the window keeps its words, so the reference stays valid
  auto const& prev = _window.word();
  auto const index = _window.index();

  if (_ctx.wpm > 0)
  {
    _window.advance();
  }
  else
  {
    _window.retreat();
  }

  _ctx.credit = 0.0;
  restart(now);

  if (_window.index() == index)
  {
    // nothing left to read in this direction
    _ctx.paused = true;

    return;
  }

  _ctx.credit += punct_credit(prev);
}

void Pacing_Engine::toggle_pause(clock::time_point const now)
{
  _ctx.paused = ! _ctx.paused;
  _ctx.credit = 0.0;
  restart(now);
}
