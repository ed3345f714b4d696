#include "IP4.hpp"

#include <charconv>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;

using tao::pegtl::abnf::DIGIT;

namespace IP4 {

using dot = one<'.'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};

// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet, eof> {
};

struct ipv4_address_lit : seq<one<'['>,
                              dec_octet,
                              dot,
                              dec_octet,
                              dot,
                              dec_octet,
                              dot,
                              dec_octet,
                              one<']'>,
                              eof> {
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<dec_octet> {
  template <typename Input>
  static void apply(Input const& in, std::vector<std::string>& a)
  {
    a.push_back(in.string());
  }
};

namespace {
std::vector<std::string> split_octets(std::string_view addr)
{
  std::vector<std::string> a;
  a.reserve(4);

  memory_input<> in{addr.data(), addr.size(), "addr"};
  if (!parse<ipv4_address, action>(in, a))
    throw std::invalid_argument(fmt::format("not an IPv4 address: {}", addr));

  return a;
}
} // namespace

auto octets(std::string_view addr) -> std::array<uint8_t, 4>
{
  auto const a{split_octets(addr)};

  std::array<uint8_t, 4> ret{};
  for (auto i{0u}; i < ret.size(); ++i) {
    std::from_chars(a[i].data(), a[i].data() + a[i].size(), ret[i]);
  }
  return ret;
}

// <https://en.wikipedia.org/wiki/Private_network#Private_IPv4_addresses>

auto is_private(std::string_view addr) -> bool
{
  auto const a{octets(addr)};

  // <https://tools.ietf.org/html/rfc1918#section-3>

  // 10.0.0.0        -   10.255.255.255  (10/8 prefix)
  // 172.16.0.0      -   172.31.255.255  (172.16/12 prefix)
  // 192.168.0.0     -   192.168.255.255 (192.168/16 prefix)

  if (a[0] == 10)
    return true;

  if (a[0] == 172)
    return (16 <= a[1]) && (a[1] <= 31);

  return (a[0] == 192) && (a[1] == 168);
}

// Anything but the unspecified address, loopback, link-local,
// multicast and the limited broadcast address.  Private networks are
// global unicast, as far as this goes.

auto is_global_unicast(std::string_view addr) -> bool
{
  auto const a{octets(addr)};

  if ((a[0] == 0) && (a[1] == 0) && (a[2] == 0) && (a[3] == 0))
    return false;

  if (a[0] == 127)
    return false;

  if ((a[0] == 169) && (a[1] == 254))
    return false;

  if ((224 <= a[0]) && (a[0] <= 239))
    return false;

  return !((a[0] == 255) && (a[1] == 255) && (a[2] == 255) && (a[3] == 255));
}

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "addr"};
  return parse<ipv4_address>(in);
}

auto is_address_literal(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "addr"};
  return parse<ipv4_address_lit>(in);
}

std::string reverse(std::string_view addr)
{
  auto const a{split_octets(addr)};
  return fmt::format("{}.{}.{}.{}.", a[3], a[2], a[1], a[0]);
}
} // namespace IP4
