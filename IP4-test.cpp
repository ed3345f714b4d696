#include "IP4.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP4::as_address;
  using IP4::is_address;
  using IP4::is_address_literal;
  using IP4::is_global_unicast;
  using IP4::is_private;
  using IP4::reverse;

  CHECK(is_address_literal("[69.0.0.0]"));
  CHECK(!is_address_literal("69.0.0.0]"));
  CHECK(!is_address_literal("[69.0.0.0"));
  CHECK(!is_address_literal("[]"));
  CHECK(!is_address_literal("[1234]"));

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("69.0.0.0"));
  CHECK(is_address("250.0.0.0"));
  CHECK(is_address("9.9.9.9"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("127.0.0.1"));

  CHECK(!is_address("127.0.0.1."));
  CHECK(!is_address("foo.bar"));
  CHECK(!is_address(""));
  CHECK(!is_address("1::"));

  // This is acceptable:
  CHECK(is_address("001.001.001.001"));
  // but not:
  CHECK(!is_address("0001.0.0.0"));

  CHECK(!is_address("256.0.0.0"));
  CHECK(!is_address("1.300.0.0"));
  CHECK(!is_address("1.1.1000.0"));
  CHECK(!is_address("1.1.1.256"));

  CHECK_EQ(reverse("1.2.3.4"), "4.3.2.1.");
  CHECK_EQ(reverse("192.168.10.3"), "3.10.168.192.");

  auto const addr     = "108.83.36.113";
  auto const addr_lit = "[108.83.36.113]";

  CHECK(is_address(addr));
  CHECK(is_address_literal(addr_lit));
  CHECK_EQ(as_address(addr_lit), addr);

  auto const oct{IP4::octets("172.16.254.1")};
  CHECK_EQ(oct[0], 172);
  CHECK_EQ(oct[1], 16);
  CHECK_EQ(oct[2], 254);
  CHECK_EQ(oct[3], 1);

  CHECK(!is_private("1.2.3.4"));
  CHECK(!is_private("127.0.0.1"));

  CHECK(is_private("10.0.0.1"));

  CHECK(!is_private("172.15.0.1"));
  CHECK(is_private("172.16.0.1"));
  CHECK(is_private("172.31.255.255"));
  CHECK(!is_private("172.32.0.1"));

  CHECK(is_private("192.168.0.1"));
  CHECK(!is_private("192.169.0.1"));

  CHECK(is_global_unicast("8.8.8.8"));
  CHECK(is_global_unicast("10.1.2.3"));
  CHECK(!is_global_unicast("0.0.0.0"));
  CHECK(!is_global_unicast("127.0.0.1"));
  CHECK(!is_global_unicast("127.255.0.9"));
  CHECK(!is_global_unicast("169.254.1.1"));
  CHECK(!is_global_unicast("224.0.0.1"));
  CHECK(!is_global_unicast("239.255.255.255"));
  CHECK(!is_global_unicast("255.255.255.255"));
  CHECK(is_global_unicast("240.0.0.1"));

  bool threw{false};
  try {
    reverse("not.an.address");
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);
}
