#include "ob/string.hh"

#include <cstddef>

#include <string>
#include <optional>
#include <regex>
#include <limits>
#include <vector>
#include <algorithm>
#include <stdexcept>

namespace OB::String
{

std::vector<std::string> split(std::string const& str, std::string const& delim,
  std::size_t size)
{
  std::vector<std::string> vtok;
  std::size_t start {0};
  auto end = str.find(delim);

  while ((size-- > 0) && (end != std::string::npos))
  {
    if (end != start)
    {
      vtok.emplace_back(str.substr(start, end - start));
    }

    start = end + delim.size();
    end = str.find(delim, start);
  }

  if (start < str.size())
  {
    vtok.emplace_back(str.substr(start));
  }

  return vtok;
}

std::string trim(std::string str)
{
  auto const first = str.find_first_not_of(" \t\n\r\f\v");

  if (first == std::string::npos)
  {
    return {};
  }

  auto const last = str.find_last_not_of(" \t\n\r\f\v");

  return str.substr(first, last - first + 1);
}

bool assert_rx(std::string const& str, std::regex rx)
{
  std::smatch m;

  return std::regex_match(str, m, rx);
}

std::optional<std::vector<std::string>> match(std::string const& str, std::regex rx)
{
  std::smatch m;

  if (! std::regex_match(str, m, rx))
  {
    return {};
  }

  std::vector<std::string> v;
  v.reserve(m.size());

  for (auto const& e : m)
  {
    v.emplace_back(e.str());
  }

  return v;
}

std::string repeat(std::size_t const num, std::string const& str)
{
  if (num == 0 || str.empty())
  {
    return {};
  }

  std::string res;
  res.reserve(num * str.size());

  for (std::size_t i = 0; i < num; ++i)
  {
    res += str;
  }

  return res;
}

std::string shell_quote(std::string const& str)
{
  std::string res {"'"};
  res.reserve(str.size() + 2);

  for (auto const ch : str)
  {
    if (ch == '\'')
    {
      res += "'\\''";
    }
    else
    {
      res += ch;
    }
  }

  res += "'";

  return res;
}

std::optional<int> to_int(std::string const& str)
{
  if (! assert_rx(str, std::regex("^[-+]?[0-9]{1,9}$")))
  {
    return {};
  }

  return std::stoi(str);
}

std::size_t damerau_levenshtein(std::string const& lhs, std::string const& rhs,
  std::size_t const weight_insert, std::size_t const weight_substitute,
  std::size_t const weight_delete, std::size_t const weight_transpose)
{
  if (lhs == rhs)
  {
    return 0;
  }

  // three rows of the distance matrix
  std::vector<std::size_t> row0 (rhs.size() + 1, 0);
  std::vector<std::size_t> row1 (rhs.size() + 1, 0);
  std::vector<std::size_t> row2 (rhs.size() + 1, 0);

  for (std::size_t j = 0; j <= rhs.size(); ++j)
  {
    row1.at(j) = j * weight_insert;
  }

  for (std::size_t i = 0; i < lhs.size(); ++i)
  {
    row2.at(0) = (i + 1) * weight_delete;

    for (std::size_t j = 0; j < rhs.size(); ++j)
    {
      // substitution
      row2.at(j + 1) = row1.at(j) + weight_substitute * (lhs.at(i) != rhs.at(j));

      // transposition
      if (i > 0 && j > 0 && lhs.at(i - 1) == rhs.at(j) &&
        lhs.at(i) == rhs.at(j - 1) &&
        row2.at(j + 1) > row0.at(j - 1) + weight_transpose)
      {
        row2.at(j + 1) = row0.at(j - 1) + weight_transpose;
      }

      // deletion
      if (row2.at(j + 1) > row1.at(j + 1) + weight_delete)
      {
        row2.at(j + 1) = row1.at(j + 1) + weight_delete;
      }

      // insertion
      if (row2.at(j + 1) > row2.at(j) + weight_insert)
      {
        row2.at(j + 1) = row2.at(j) + weight_insert;
      }
    }

    std::swap(row0, row1);
    std::swap(row1, row2);
  }

  return row1.at(rhs.size());
}

} // namespace OB::String
