#ifndef RULES_LOAD_DOT_HPP
#define RULES_LOAD_DOT_HPP

#include "Rules.hpp"

#include <string>
#include <vector>

namespace Rules {

// How to build a Ruleset for one connection.
struct Config {
  bool std_rules{true};       // reject bad addresses and a missing HELO
  bool reject_message{false}; // @message reject all

  std::string fromreject; // MAIL FROM addresses to reject
  std::string toaccept;   // RCPT TO addresses to accept, reject the rest
  std::string heloreject; // HELO names to reject

  std::vector<std::string> files;
};

// From the command line flags.
Config config_from_flags();

// The generated rules first, then each file in order.  Throws
// parse_error for any rule file problem.
Ruleset build(Config const& config);

// As build(), but on any error log it, just the first time, and return
// a ruleset that stalls everything.
Ruleset load_or_stall(Config const& config);

} // namespace Rules

#endif // RULES_LOAD_DOT_HPP
