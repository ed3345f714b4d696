#include "IP6.hpp"

#include "IP4.hpp"

#include <fmt/format.h>

#include <arpa/inet.h>
#include <arpa/nameser.h>

#include <stdexcept>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::one;
using tao::pegtl::opt;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::rep_opt;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;
using tao::pegtl::two;

using tao::pegtl::abnf::DIGIT;
using tao::pegtl::abnf::HEXDIG;

namespace IP6 {

using dot   = one<'.'>;
using colon = one<':'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};
// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet> {
};

struct h16 : rep_min_max<1, 4, HEXDIG> {
};

struct ls32 : sor<seq<h16, colon, h16>, ipv4_address> {
};

struct dcolon : two<':'> {
};

// clang-format off
struct ipv6_address : sor<seq<                                          rep<6, h16, colon>, ls32>,
                          seq<                                  dcolon, rep<5, h16, colon>, ls32>,
                          seq<opt<h16                        >, dcolon, rep<4, h16, colon>, ls32>,
                          seq<opt<h16,     opt<   colon, h16>>, dcolon, rep<3, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<2, colon, h16>>, dcolon, rep<2, h16, colon>, ls32>,
                          seq<opt<h16, rep_opt<3, colon, h16>>, dcolon,        h16, colon,  ls32>,
                          seq<opt<h16, rep_opt<4, colon, h16>>, dcolon,                     ls32>,
                          seq<opt<h16, rep_opt<5, colon, h16>>, dcolon,                      h16>,
                          seq<opt<h16, rep_opt<6, colon, h16>>, dcolon                          >> {};
// clang-format on

struct ipv6_address_literal : seq<TAO_PEGTL_ISTRING("[IPv6:"),
                                  ipv6_address,
                                  one<']'>> {
};

struct ipv6_address_only : seq<ipv6_address, eof> {
};
struct ipv6_address_literal_only : seq<ipv6_address_literal, eof> {
};

auto bytes(std::string_view addr_str) -> std::array<uint8_t, 16>
{
  std::array<uint8_t, 16> addr{};

  static_assert(sizeof(addr) == sizeof(in6_addr), "in6_addr is the wrong size");

  auto const str{std::string(addr_str)};
  if (inet_pton(AF_INET6, str.c_str(), addr.data()) != 1)
    throw std::invalid_argument(fmt::format("not an IPv6 address: {}", str));

  return addr;
}

namespace {
// ::ffff:a.b.c.d is an IPv4 address in IPv6 clothing.
bool is_v4_mapped(std::array<uint8_t, 16> const& a)
{
  for (auto i{0}; i < 10; ++i) {
    if (a[i])
      return false;
  }
  return (a[10] == 0xFF) && (a[11] == 0xFF);
}

std::string v4_part(std::array<uint8_t, 16> const& a)
{
  return fmt::format("{}.{}.{}.{}", a[12], a[13], a[14], a[15]);
}
} // namespace

bool is_private(std::string_view addr)
{
  auto const a{bytes(addr)};

  if (is_v4_mapped(a))
    return IP4::is_private(v4_part(a));

  // <https://en.wikipedia.org/wiki/Private_network#Private_IPv6_addresses>
  // Unique local FC00::/7 and the deprecated site local FEC0::/10.
  if ((a[0] & 0xFE) == 0xFC)
    return true;
  return (a[0] == 0xFE) && ((a[1] & 0xC0) == 0xC0);
}

bool is_global_unicast(std::string_view addr)
{
  auto const a{bytes(addr)};

  if (is_v4_mapped(a))
    return IP4::is_global_unicast(v4_part(a));

  auto zeros{0};
  for (auto i{0}; i < 15; ++i) {
    if (a[i] == 0)
      ++zeros;
  }
  if (zeros == 15 && (a[15] == 0 || a[15] == 1)) // :: and ::1
    return false;

  if (a[0] == 0xFF) // multicast
    return false;

  return !((a[0] == 0xFE) && ((a[1] & 0xC0) == 0x80)); // link local
}

bool is_address(std::string_view addr)
{
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  return parse<IP6::ipv6_address_only>(in);
}

bool is_address_literal(std::string_view addr)
{
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  return parse<IP6::ipv6_address_literal_only>(in);
}

std::string reverse(std::string_view addr_str)
{
  auto const addr{bytes(addr_str)};

  auto q{std::string{}};
  q.reserve(4 * NS_IN6ADDRSZ);

  for (auto n{NS_IN6ADDRSZ - 1}; n >= 0; --n) {
    auto const ch = addr[n];

    auto const lo = ch & 0xF;
    auto const hi = (ch >> 4) & 0xF;

    auto constexpr hex_digits = "0123456789abcdef";

    q += hex_digits[lo];
    q += '.';
    q += hex_digits[hi];
    q += '.';
  }

  return q;
}
} // namespace IP6
