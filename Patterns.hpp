#ifndef PATTERNS_DOT_HPP
#define PATTERNS_DOT_HPP

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Turns the argument of a match operator into the list of patterns it
// stands for.  An argument starting with "/", "./" or "file:" names a
// file with one pattern per line; anything else is itself the only
// pattern.  Files are read once per Patterns object, which lives as
// long as one connection.

class Patterns {
public:
  static bool is_file_ref(std::string_view arg);

  // Empty if the file is missing, unreadable or has no patterns.
  std::vector<std::string> const& resolve(std::string const& arg);

private:
  std::unordered_map<std::string, std::vector<std::string>> lists_;
};

#endif // PATTERNS_DOT_HPP
