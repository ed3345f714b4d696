#ifndef DNS_LOOKUP_DOT_HPP
#define DNS_LOOKUP_DOT_HPP

#include <cstdint>
#include <string>
#include <vector>

// What the rule engine needs from DNS.  DNS_ldns::Resolver is the
// real thing.

namespace DNS {

enum class lookup_status : uint8_t {
  ok,        // answer, possibly empty
  permanent, // NXDOMAIN, no data
  transient, // SERVFAIL, timeout, anything else
};

constexpr char const* lookup_status_c_str(lookup_status st)
{
  switch (st) { // clang-format off
  case lookup_status::ok:        return "ok";
  case lookup_status::permanent: return "permanent";
  case lookup_status::transient: return "transient";
  } // clang-format on
  return "*** unknown lookup_status ***";
}

// Exchange names are absolute, with the trailing dot.  A null MX is
// just ".".
struct MX {
  std::string exchange;
  uint16_t    preference{0};
};

class Lookup {
public:
  virtual ~Lookup() = default;

  // MX records; permanent if the domain has none.
  virtual lookup_status
  mx(std::string const& domain, std::vector<MX>& mxs, std::string& msg) = 0;

  // A and AAAA records, as printable addresses.
  virtual lookup_status addresses(std::string const&        host,
                                  std::vector<std::string>& addrs,
                                  std::string&              msg) = 0;

  // PTR records for a reversed name under in-addr.arpa or ip6.arpa,
  // names returned without the trailing dot.
  virtual lookup_status ptr(std::string const&        name,
                            std::vector<std::string>& names,
                            std::string&              msg) = 0;

  // Does name have an A record, the usual blocklist protocol.
  virtual bool listed(std::string const& name) = 0;
};

} // namespace DNS

#endif // DNS_LOOKUP_DOT_HPP
