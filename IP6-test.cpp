#include "IP6.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP6::as_address;
  using IP6::is_address;
  using IP6::is_address_literal;
  using IP6::is_global_unicast;
  using IP6::is_private;

  CHECK(is_address("::1"));
  CHECK(is_address("1::"));
  CHECK(is_address_literal("[IPv6:::1]"));
  CHECK(is_address_literal("[ipv6:::1]"));
  CHECK(!is_address_literal("[::1]"));

  CHECK(is_address("::ffff:0.0.0.0"));
  CHECK(is_address("::ffff:255.255.255.255"));

  CHECK(is_address("fd12:3456:789a:1::1"));
  CHECK(!is_address("127.0.0.1"));
  CHECK(!is_address("abc.def"));

  auto const addr{"2001:0db8:85a3:0000:0000:8a2e:0370:7334"};
  auto const addr_lit{"[IPv6:2001:0db8:85a3:0000:0000:8a2e:0370:7334]"};

  CHECK(is_address(addr));
  CHECK(is_address_literal(addr_lit));
  CHECK_EQ(as_address(addr_lit), addr);

  CHECK(!is_private(addr));
  CHECK(is_private("fd12:3456:789a:1::1"));
  CHECK(is_private("fc00::1"));
  CHECK(is_private("fec0::1"));
  CHECK(!is_private("fe80::1"));
  CHECK(is_private("::ffff:192.168.1.1"));
  CHECK(!is_private("::ffff:8.8.8.8"));

  CHECK(is_global_unicast(addr));
  CHECK(is_global_unicast("fd12:3456:789a:1::1"));
  CHECK(!is_global_unicast("::"));
  CHECK(!is_global_unicast("::1"));
  CHECK(!is_global_unicast("fe80::1"));
  CHECK(!is_global_unicast("ff02::1"));
  CHECK(!is_global_unicast("::ffff:127.0.0.1"));
  CHECK(is_global_unicast("::ffff:8.8.8.8"));

  auto const bytes{IP6::bytes("::1")};
  CHECK_EQ(bytes[15], 1);
  CHECK_EQ(bytes[0], 0);

  CHECK_EQ(IP6::reverse("2001:db8::1"),
           "1.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2.");
}
