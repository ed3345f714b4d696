#ifndef DNS_FCRDNS_DOT_HPP
#define DNS_FCRDNS_DOT_HPP

#include "DNS-lookup.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace DNS {

// The PTR names for an address, sorted by what their forward lookup
// says about them.
struct Rdns {
  std::vector<std::string> verified;     // forward lookup includes addr
  std::vector<std::string> nofwd;        // forward lookup failed
  std::vector<std::string> inconsistent; // forward lookup without addr
};

Rdns fcrdns4(Lookup& res, std::string_view addr);
Rdns fcrdns6(Lookup& res, std::string_view addr);
Rdns fcrdns(Lookup& res, std::string_view addr);

} // namespace DNS

#endif // DNS_FCRDNS_DOT_HPP
