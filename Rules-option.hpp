#ifndef RULES_OPTION_DOT_HPP
#define RULES_OPTION_DOT_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace Rules {

// Attributes of a HELO name, of the reverse DNS of the remote IP, and
// of an address, plus the sources a dbl rule looks at.  Each matcher
// only looks at the bits of its own kind.

enum class Option : uint64_t {
  zero = 0,

  // helo-has
  helo     = 1ull << 0,
  ehlo     = 1ull << 1,
  none     = 1ull << 2,
  bogus    = 1ull << 3,
  nodots   = 1ull << 4,
  bareip   = 1ull << 5,
  properip = 1ull << 6,
  myip     = 1ull << 7,
  remoteip = 1ull << 8,
  otherip  = 1ull << 9,

  // dns
  nodns        = 1ull << 10,
  inconsistent = 1ull << 11,
  noforward    = 1ull << 12,
  good         = 1ull << 13,
  exists       = 1ull << 14,

  // from-has, to-has
  unqualified     = 1ull << 15,
  route           = 1ull << 16,
  quoted          = 1ull << 17,
  noat            = 1ull << 18,
  garbage         = 1ull << 19,
  domain_valid    = 1ull << 20,
  domain_invalid  = 1ull << 21,
  domain_tempfail = 1ull << 22,

  // dbl sources, ehlo is shared with helo-has
  host = 1ull << 23,
  from = 1ull << 24,

  // groups
  bad = unqualified | route | noat | garbage,
  ip  = bareip | properip,
  any = host | ehlo | from,

  domain_checked = domain_valid | domain_invalid | domain_tempfail,
};

constexpr Option operator|(Option a, Option b)
{
  return static_cast<Option>(static_cast<uint64_t>(a) |
                             static_cast<uint64_t>(b));
}

constexpr Option operator&(Option a, Option b)
{
  return static_cast<Option>(static_cast<uint64_t>(a) &
                             static_cast<uint64_t>(b));
}

constexpr Option operator~(Option a)
{
  return static_cast<Option>(~static_cast<uint64_t>(a));
}

constexpr Option& operator|=(Option& a, Option b) { return a = a | b; }

// Any of bits set in opts?
constexpr bool test(Option opts, Option bits)
{
  return (opts & bits) != Option::zero;
}

// Which keywords apply, by matcher.
enum class option_kind : uint8_t {
  address, // from-has, to-has
  helo,    // helo-has
  dns,     // dns
  dbl,     // dbl sources
};

// Keyword to bits, nullopt if name is not a keyword of this kind.
std::optional<Option> find_option(option_kind kind, std::string_view name);

// Comma separated keywords in sorted order, a group's name standing in
// for all of its bits.
std::string option_str(option_kind kind, Option opts);

std::ostream& operator<<(std::ostream& os, Option opts);

} // namespace Rules

#endif // RULES_OPTION_DOT_HPP
