#ifndef RULES_MATCH_DOT_HPP
#define RULES_MATCH_DOT_HPP

#include <string_view>

namespace Rules {

// Address patterns:
//   <>     the null sender, and nothing else
//   a@b    exactly a@b
//   a@     local part a, any domain (also matches a bare "a")
//   @b     domain b
//   @.b    domain b or any subdomain of b
//   @      any address with both a local part and a domain
// Comparison is done in lower case.  Addresses that start or end
// with '@' never match.
bool match_address(std::string_view addr, std::string_view pattern);

// Host patterns: b is exactly b, .b is b or anything ending in .b.
bool match_host(std::string_view host, std::string_view pattern);

// An IP address against an address or CIDR network.
bool match_ip(std::string_view addr, std::string_view pattern);

// Does the domain of addr match a host pattern.
bool match_from_host(std::string_view addr, std::string_view host_pattern);

} // namespace Rules

#endif // RULES_MATCH_DOT_HPP
