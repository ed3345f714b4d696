#include "IP.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  CHECK(IP::is_address("127.0.0.1"));
  CHECK(IP::is_address("::1"));
  CHECK(!IP::is_address("[127.0.0.1]"));
  CHECK(IP::is_address_literal("[127.0.0.1]"));
  CHECK(IP::is_address_literal("[IPv6:::1]"));
  CHECK_EQ(IP::as_address("[IPv6:::1]"), "::1");

  CHECK(IP::is_private("10.1.1.1"));
  CHECK(IP::is_private("fd00::1"));
  CHECK(!IP::is_private("8.8.8.8"));
  CHECK(!IP::is_private("not an address"));

  CHECK(!IP::is_global_unicast("127.0.0.1"));
  CHECK(IP::is_global_unicast("8.8.8.8"));
  CHECK(!IP::is_global_unicast("junk"));

  CHECK(IP::same_address("::1", "0:0::1"));
  CHECK(IP::same_address("192.168.10.3", "192.168.10.3"));
  CHECK(IP::same_address("001.002.003.004", "1.2.3.4"));
  CHECK(!IP::same_address("192.168.10.3", "192.168.10.4"));
  CHECK(!IP::same_address("127.0.0.1", "::1"));
  CHECK(!IP::same_address("", ""));

  CHECK(IP::is_network("10.0.0.0/8"));
  CHECK(IP::is_network("10.1.2.3"));
  CHECK(IP::is_network("2001:db8::/32"));
  CHECK(IP::is_network("0.0.0.0/0"));
  CHECK(!IP::is_network("10.0.0.0/33"));
  CHECK(!IP::is_network("10.0.0.0/"));
  CHECK(!IP::is_network("10.0.0.0/8x"));
  CHECK(!IP::is_network("host.example.com"));
  CHECK(!IP::is_network("2001:db8::/129"));

  CHECK(IP::in_network("10.200.3.4", "10.0.0.0/8"));
  CHECK(!IP::in_network("11.0.0.1", "10.0.0.0/8"));
  CHECK(IP::in_network("172.31.0.1", "172.16.0.0/12"));
  CHECK(!IP::in_network("172.32.0.1", "172.16.0.0/12"));
  CHECK(IP::in_network("192.168.10.3", "192.168.10.3"));
  CHECK(!IP::in_network("192.168.10.4", "192.168.10.3"));
  CHECK(IP::in_network("1.2.3.4", "0.0.0.0/0"));
  CHECK(IP::in_network("2001:db8:1::5", "2001:db8::/32"));
  CHECK(!IP::in_network("2001:db9::5", "2001:db8::/32"));
  CHECK(!IP::in_network("10.0.0.1", "::/0"));
  CHECK(!IP::in_network("", "10.0.0.0/8"));
}
