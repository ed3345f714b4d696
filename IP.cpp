#include "IP.hpp"

#include "IP4.hpp"
#include "IP6.hpp"

#include <charconv>
#include <cstdint>
#include <vector>

#include <glog/logging.h>

namespace IP {
bool is_private(std::string_view addr)
{
  if (IP4::is_address(addr))
    return IP4::is_private(addr);
  if (IP6::is_address(addr))
    return IP6::is_private(addr);
  return false;
}

bool is_global_unicast(std::string_view addr)
{
  if (IP4::is_address(addr))
    return IP4::is_global_unicast(addr);
  if (IP6::is_address(addr))
    return IP6::is_global_unicast(addr);
  return false;
}

bool is_address(std::string_view addr)
{
  return IP4::is_address(addr) || IP6::is_address(addr);
}

bool is_address_literal(std::string_view addr)
{
  return IP4::is_address_literal(addr) || IP6::is_address_literal(addr);
}

std::string_view as_address(std::string_view addr)
{
  if (IP4::is_address_literal(addr))
    return IP4::as_address(addr);
  if (IP6::is_address_literal(addr))
    return IP6::as_address(addr);
  LOG(FATAL) << "not a valid IP address literal " << addr;
}

namespace {
// Network byte order, 4 bytes for IPv4 and 16 for IPv6, empty if
// not an address at all.
std::vector<uint8_t> as_bytes(std::string_view addr)
{
  if (IP4::is_address(addr)) {
    auto const a{IP4::octets(addr)};
    return {begin(a), end(a)};
  }
  if (IP6::is_address(addr)) {
    auto const a{IP6::bytes(addr)};
    return {begin(a), end(a)};
  }
  return {};
}

struct network {
  std::vector<uint8_t> bytes;
  unsigned             prefix{0};
};

bool parse_network(std::string_view net, network& n)
{
  auto const slash{net.find('/')};

  n.bytes = as_bytes(net.substr(0, slash));
  if (n.bytes.empty())
    return false;

  auto const max_prefix{static_cast<unsigned>(n.bytes.size() * 8)};

  if (slash == std::string_view::npos) {
    n.prefix = max_prefix;
    return true;
  }

  auto const len{net.substr(slash + 1)};
  if (len.empty())
    return false;

  auto const [ptr, ec]
      = std::from_chars(len.data(), len.data() + len.size(), n.prefix);
  if ((ec != std::errc{}) || (ptr != len.data() + len.size()))
    return false;

  return n.prefix <= max_prefix;
}
} // namespace

bool same_address(std::string_view a, std::string_view b)
{
  auto const a_bytes{as_bytes(a)};
  return !a_bytes.empty() && (a_bytes == as_bytes(b));
}

bool is_network(std::string_view net)
{
  network n;
  return parse_network(net, n);
}

bool in_network(std::string_view addr, std::string_view net)
{
  network n;
  if (!parse_network(net, n))
    return false;

  auto const a{as_bytes(addr)};
  if (a.size() != n.bytes.size())
    return false;

  auto bits{n.prefix};
  for (auto i{0u}; bits && i < a.size(); ++i) {
    auto const mask{static_cast<uint8_t>(bits >= 8 ? 0xFF : (0xFF << (8 - bits)))};
    if ((a[i] & mask) != (n.bytes[i] & mask))
      return false;
    bits -= (bits >= 8) ? 8 : bits;
  }

  return true;
}
} // namespace IP
