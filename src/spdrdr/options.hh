#ifndef SPDRDR_OPTIONS_HH
#define SPDRDR_OPTIONS_HH

#include <cstddef>

#include <string>
#include <vector>
#include <utility>
#include <sstream>
#include <stdexcept>

// command line parser
//
// options are registered with 'set' under a long name and an optional
// single character short name, written as "long,s"
class Options
{
public:

  Options(int const argc, char const* const* argv);
  explicit Options(std::vector<std::string> args);

  Options& name(std::string const& val);
  std::string name() const;

  Options& version(std::string const& val);
  std::string version() const;

  Options& description(std::string const& val);
  Options& usage(std::string const& val);
  Options& info(std::string const& title, std::vector<std::string> const& lines);

  // flag
  Options& set(std::string const& names, std::string const& help);

  // option taking a value
  Options& set(std::string const& names, std::string const& value,
    std::string const& arg, std::string const& help);

  // accept positional arguments
  Options& set_pos();

  // 0 on success, -1 on error
  int parse();

  // true if the option was given on the command line
  bool find(std::string const& name) const;

  template<typename T>
  T get(std::string const& name) const
  {
    auto const& opt = lookup(name);

    std::istringstream ss {opt.value};
    T val {};

    if (! (ss >> val) || ! (ss >> std::ws).eof())
    {
      throw std::invalid_argument("invalid value '" + opt.value +
        "' for option '--" + name + "'");
    }

    return val;
  }

  std::vector<std::string> get_pos_vec() const;

  std::string help() const;
  std::string usage() const;
  std::string error() const;

  // registered long names close to the last unknown option
  std::vector<std::string> similar() const;

private:

  struct Option
  {
    std::string name;
    std::string brief;
    std::string arg;
    std::string help;
    std::string value;
    bool is_flag {true};
    bool found {false};
  };

  Option const& lookup(std::string const& name) const;
  Option* find_long(std::string const& name);
  Option* find_short(std::string const& brief);

  std::vector<std::string> _args;

  std::string _name;
  std::string _version;
  std::string _description;
  std::vector<std::string> _usage;
  std::vector<std::pair<std::string, std::vector<std::string>>> _info;

  std::vector<Option> _options;
  std::vector<std::string> _pos;
  bool _is_pos {false};

  std::string _error;
  std::string _unknown;
};

template<>
inline bool Options::get<bool>(std::string const& name) const
{
  return lookup(name).found;
}

template<>
inline std::string Options::get<std::string>(std::string const& name) const
{
  return lookup(name).value;
}

#endif // SPDRDR_OPTIONS_HH
