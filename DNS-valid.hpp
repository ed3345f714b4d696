#ifndef DNS_VALID_DOT_HPP
#define DNS_VALID_DOT_HPP

#include "DNS-lookup.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace DNS {

// Ordered: a domain's validity is the best seen over all its MXs.
enum class validity : uint8_t {
  undefined,
  bad,
  tempfail,
  good,
};

constexpr char const* validity_c_str(validity v)
{
  switch (v) { // clang-format off
  case validity::undefined: return "undefined";
  case validity::bad:       return "bad";
  case validity::tempfail:  return "tempfail";
  case validity::good:      return "good";
  } // clang-format on
  return "*** unknown validity ***";
}

// Labels of 1 to 63 octets, 253 in all, with or without the trailing
// dot.  The root alone is not a domain name here.
bool is_domain_name(std::string_view name);

// Can host receive mail from the Internet at large: all its addresses
// must be global unicast and not private.
validity check_ip(Lookup& res, std::string const& host, std::string& msg);

// Could domain plausibly receive mail, going by its MX records, or by
// its addresses when it has none.
validity valid_domain(Lookup& res, std::string_view domain, std::string& msg);

} // namespace DNS

#endif // DNS_VALID_DOT_HPP
