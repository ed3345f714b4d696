#ifndef RULES_PARSE_DOT_HPP
#define RULES_PARSE_DOT_HPP

#include "Rules.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace Rules {

// Anything wrong with a rules file, with "file:line: " up front.
class parse_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Rules from text, the source is only used in error messages.  Any
// include directives are read and parsed right away.
std::vector<Rule> parse(std::string_view text, std::string const& source);

std::vector<Rule> parse_file(std::string const& path);

} // namespace Rules

#endif // RULES_PARSE_DOT_HPP
