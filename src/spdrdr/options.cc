#include "spdrdr/options.hh"

#include "ob/string.hh"

#include <cstddef>

#include <string>
#include <vector>
#include <sstream>
#include <utility>
#include <algorithm>
#include <stdexcept>

Options::Options(int const argc, char const* const* argv)
{
  for (int i = 1; i < argc; ++i)
  {
    _args.emplace_back(argv[i]);
  }
}

Options::Options(std::vector<std::string> args) :
  _args {std::move(args)}
{
}

Options& Options::name(std::string const& val)
{
  _name = val;

  return *this;
}

std::string Options::name() const
{
  return _name;
}

Options& Options::version(std::string const& val)
{
  _version = val;

  return *this;
}

std::string Options::version() const
{
  return _version;
}

Options& Options::description(std::string const& val)
{
  _description = val;

  return *this;
}

Options& Options::usage(std::string const& val)
{
  _usage.emplace_back(val);

  return *this;
}

Options& Options::info(std::string const& title, std::vector<std::string> const& lines)
{
  _info.emplace_back(title, lines);

  return *this;
}

Options& Options::set(std::string const& names, std::string const& help)
{
  auto const keys = OB::String::split(names, ",");

  Option opt;
  opt.name = keys.at(0);
  opt.brief = keys.size() > 1 ? keys.at(1) : "";
  opt.help = help;
  opt.is_flag = true;

  _options.emplace_back(opt);

  return *this;
}

Options& Options::set(std::string const& names, std::string const& value,
  std::string const& arg, std::string const& help)
{
  auto const keys = OB::String::split(names, ",");

  Option opt;
  opt.name = keys.at(0);
  opt.brief = keys.size() > 1 ? keys.at(1) : "";
  opt.arg = arg;
  opt.help = help;
  opt.value = value;
  opt.is_flag = false;

  _options.emplace_back(opt);

  return *this;
}

Options& Options::set_pos()
{
  _is_pos = true;

  return *this;
}

int Options::parse()
{
  for (std::size_t i = 0; i < _args.size(); ++i)
  {
    auto const& arg = _args.at(i);

    // everything after '--' is positional
    if (arg == "--")
    {
      for (++i; i < _args.size(); ++i)
      {
        if (! _is_pos)
        {
          _error = "unexpected argument '" + _args.at(i) + "'";

          return -1;
        }

        _pos.emplace_back(_args.at(i));
      }

      break;
    }

    Option* opt {nullptr};
    std::string key;
    std::string value;
    bool has_value {false};

    if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
    {
      key = arg.substr(2);

      if (auto const pos = key.find('='); pos != std::string::npos)
      {
        value = key.substr(pos + 1);
        key = key.substr(0, pos);
        has_value = true;
      }

      opt = find_long(key);
      key = "--" + key;
    }
    else if (arg.size() == 2 && arg.at(0) == '-' && arg.at(1) != '-')
    {
      opt = find_short(arg.substr(1));
      key = arg;
    }
    else
    {
      if (! _is_pos)
      {
        _error = "unexpected argument '" + arg + "'";

        return -1;
      }

      _pos.emplace_back(arg);

      continue;
    }

    if (! opt)
    {
      _unknown = arg.size() > 2 && arg.at(1) == '-' ? key.substr(2) : "";
      _error = "invalid option '" + key + "'";

      return -1;
    }

    if (opt->is_flag)
    {
      if (has_value)
      {
        _error = "flag '" + key + "' does not take a value";

        return -1;
      }

      opt->found = true;

      continue;
    }

    if (! has_value)
    {
      if (i + 1 >= _args.size())
      {
        _error = "option '" + key + "' requires a value";

        return -1;
      }

      value = _args.at(++i);
    }

    opt->value = value;
    opt->found = true;
  }

  return 0;
}

bool Options::find(std::string const& name) const
{
  return lookup(name).found;
}

std::vector<std::string> Options::get_pos_vec() const
{
  return _pos;
}

std::string Options::usage() const
{
  std::ostringstream ss;

  for (auto const& e : _usage)
  {
    ss << "  " << _name << " " << e << "\n";
  }

  return ss.str();
}

std::string Options::help() const
{
  std::ostringstream ss;

  ss
  << _name << " v" << _version << "\n\n"
  << "Description:\n  " << _description << "\n\n"
  << "Usage:\n" << usage() << "\n"
  << "Options:\n";

  for (auto const& e : _options)
  {
    ss << "  ";

    if (! e.brief.empty())
    {
      ss << "-" << e.brief << ", ";
    }

    ss << "--" << e.name;

    if (! e.is_flag)
    {
      ss << "=<" << e.arg << ">";
    }

    ss << "\n    " << e.help << "\n";
  }

  for (auto const& [title, lines] : _info)
  {
    ss << "\n" << title << ":\n";

    for (auto const& e : lines)
    {
      ss << "  " << e << "\n";
    }
  }

  return ss.str();
}

std::string Options::error() const
{
  return _error;
}

std::vector<std::string> Options::similar() const
{
  std::vector<std::string> res;

  if (_unknown.empty())
  {
    return res;
  }

  std::size_t const limit {2};

  for (auto const& e : _options)
  {
    if (OB::String::damerau_levenshtein(_unknown, e.name) <= limit)
    {
      res.emplace_back(e.name);
    }
  }

  return res;
}

Options::Option const& Options::lookup(std::string const& name) const
{
  auto const it = std::find_if(_options.cbegin(), _options.cend(),
    [&](auto const& e) { return e.name == name; });

  if (it == _options.cend())
  {
    throw std::out_of_range("unregistered option '" + name + "'");
  }

  return *it;
}

Options::Option* Options::find_long(std::string const& name)
{
  auto const it = std::find_if(_options.begin(), _options.end(),
    [&](auto const& e) { return e.name == name; });

  return it == _options.end() ? nullptr : &*it;
}

Options::Option* Options::find_short(std::string const& brief)
{
  auto const it = std::find_if(_options.begin(), _options.end(),
    [&](auto const& e) { return ! e.brief.empty() && e.brief == brief; });

  return it == _options.end() ? nullptr : &*it;
}
