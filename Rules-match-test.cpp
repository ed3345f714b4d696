#include "Rules-match.hpp"

#include <glog/logging.h>

using Rules::match_address;
using Rules::match_from_host;
using Rules::match_host;
using Rules::match_ip;

int main(int argc, char* argv[])
{
  struct {
    char const* addr;
    char const* pat;
  } const addr_matches[]{
      {"abc@def", "abc@def"},
      {"", "<>"},
      {"abc@def", "abc@"},
      {"abc@def", "@def"},
      {"abc", "abc@"},
      {"abc@def.ghi", "@.ghi"},
      {"abc@def.ghi", "@.def.ghi"},
      {"anything@anything", "@"},
      // upper case addresses match lower case patterns
      {"ABC@DEF", "abc@"},
      {"ABC@DEF", "@def"},
      // and the other way around
      {"abc@def", "@DEF"},
  };
  for (auto const& m : addr_matches) {
    CHECK(match_address(m.addr, m.pat))
        << "did not match '" << m.addr << "' with pattern '" << m.pat << "'";
  }

  struct {
    char const* addr;
    char const* pat;
  } const addr_misses[]{
      {"abc@def", "not"},
      {"abc@def", "@ghi"},
      {"abc@def", "def@"},
      {"anything", "<>"},
      {"noat", "@"},
      {"abc@zamdef.ghi", "@.def.ghi"},
      {"", "@"},
      {"@route", "@"},
      {"broken@", "@"},
      {"abc@def", ""},
      {"@route", "@route"},
  };
  for (auto const& m : addr_misses) {
    CHECK(!match_address(m.addr, m.pat))
        << "did match '" << m.addr << "' with pattern '" << m.pat << "'";
  }

  struct {
    char const* host;
    char const* pat;
  } const host_matches[]{
      {"abc", "abc"},
      {"abc", ".abc"},
      {"abc.def", ".def"},
      {"abc.def.ghi", ".ghi"},
      {".", "."},
      {"MX.Friend.COM", ".friend.com"},
      {"mx.friend.com.", ".friend.com"},
  };
  for (auto const& m : host_matches) {
    CHECK(match_host(m.host, m.pat))
        << "did not match '" << m.host << "' with pattern '" << m.pat << "'";
  }

  struct {
    char const* host;
    char const* pat;
  } const host_misses[]{
      {"abc", "not"},
      {"abc", ".not"},
      {"prefabc", ".abc"},
      {".", "not"},
      {".", ".not"},
      {"abc", ""},
  };
  for (auto const& m : host_misses) {
    CHECK(!match_host(m.host, m.pat))
        << "did match '" << m.host << "' with pattern '" << m.pat << "'";
  }

  CHECK(match_ip("192.168.10.3", "192.168.10.3"));
  CHECK(match_ip("192.168.10.3", "192.168.0.0/16"));
  CHECK(!match_ip("192.169.10.3", "192.168.0.0/16"));
  CHECK(match_ip("2001:db8::1", "2001:db8::/32"));
  CHECK(!match_ip("192.168.10.3", "not-an-ip"));
  CHECK(!match_ip("", "10.0.0.0/8"));

  CHECK(match_from_host("joe@mail.example.com", ".example.com"));
  CHECK(match_from_host("joe@example.com", ".example.com"));
  CHECK(match_from_host("joe@example.com", "example.com"));
  CHECK(!match_from_host("joe@mail.example.com", "example.com"));
  CHECK(!match_from_host("", "example.com"));
}
