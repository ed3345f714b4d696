#ifndef IEQUAL_DOT_HPP
#define IEQUAL_DOT_HPP

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>

// Like boost, but ASCII only.  Only C locale required.

inline bool iequal_char(char a, char b)
{
  return std::tolower(static_cast<unsigned char>(a)) ==
         std::tolower(static_cast<unsigned char>(b));
}

inline bool iequal(std::string_view a, std::string_view b)
{
  return (size(a) == size(b)) &&
         std::equal(begin(b), end(b), begin(a), iequal_char);
}

inline bool iends_with(std::string_view str, std::string_view suffix)
{
  return (str.size() >= suffix.size()) &&
         iequal(str.substr(str.size() - suffix.size()), suffix);
}

// Patterns and the values they are matched against are compared in
// lower case.

inline std::string to_lower(std::string_view str)
{
  std::string ret;
  ret.reserve(str.size());
  std::transform(begin(str), end(str), std::back_inserter(ret), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return ret;
}

#endif // IEQUAL_DOT_HPP
