#ifndef RULES_ATTRS_DOT_HPP
#define RULES_ATTRS_DOT_HPP

#include "DNS-fcrdns.hpp"
#include "DNS-valid.hpp"
#include "Rules-option.hpp"

#include <string_view>

namespace Rules {

// The syntactic attributes of an address: quoted, route, noat,
// garbage, unqualified.  This is a heuristic and not an RFC 5321
// parser.  Sets domain to the part after the last '@'.
Option address_shape(std::string_view addr, std::string_view& domain);

// Shapes that never get a domain validity check.
constexpr auto not_plain{Option::route | Option::unqualified | Option::garbage
                         | Option::noat};

Option validity_option(DNS::validity v);

// The HELO name, not including which verb was used to send it.
Option helo_shape(std::string_view helo,
                  std::string_view local_ip,
                  std::string_view remote_ip);

Option dns_shape(DNS::Rdns const& rdns);

} // namespace Rules

#endif // RULES_ATTRS_DOT_HPP
