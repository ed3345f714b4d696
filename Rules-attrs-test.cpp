#include "Rules-attrs.hpp"

#include "DNS-fake.hpp"
#include "Patterns.hpp"
#include "Rules-context.hpp"

#include <glog/logging.h>

using DNS::lookup_status;
using Rules::Option;

int main(int argc, char* argv[])
{
  struct {
    char const* addr;
    Option      opts;
  } const addrs[]{
      {"", Option::zero},
      {"noat", Option::noat},
      {"\"fred\"@jones", Option::quoted | Option::unqualified},
      {"jim@jones", Option::unqualified},
      {"@jones:user@jim.bob", Option::route},
      {"@j:user@jim", Option::route | Option::unqualified},
      {"@garbage", Option::garbage | Option::unqualified},
      {"garbage@", Option::garbage | Option::unqualified},
      {"<job@jim.bob", Option::garbage},
      {"joe..@jim.bob", Option::garbage},
      {"joe@@jim.bob", Option::garbage},
      {"joe@jim.bob\"", Option::garbage},
      {"joe@jim.bob>", Option::garbage},
      {"\"joe..bob\"@jim.bob", Option::quoted | Option::garbage},
      {"joe@jim.bob", Option::zero},
  };
  for (auto const& a : addrs) {
    std::string_view domain;
    CHECK(Rules::address_shape(a.addr, domain) == a.opts)
        << "'" << a.addr << "' is " << Rules::address_shape(a.addr, domain)
        << " not " << a.opts;
  }

  std::string_view domain;
  Rules::address_shape("\"fred\"@jones", domain);
  CHECK_EQ(domain, "jones");
  Rules::address_shape("@jones:user@jim.bob", domain);
  CHECK_EQ(domain, "jim.bob");

  constexpr auto local{"127.0.0.1"};
  constexpr auto remote{"192.168.10.3"};

  struct {
    char const* helo;
    Option      opts;
  } const helos[]{
      {"", Option::none | Option::nodots},
      {"abc.def", Option::zero},
      {"abcdef", Option::nodots},
      {".", Option::bogus | Option::nodots},
      {"127.0.0.1", Option::bareip | Option::myip},
      {"[127.0.0.1]", Option::properip | Option::myip},
      {"[127.100.100.100]", Option::properip | Option::otherip},
      {"[192.168.10.3]", Option::properip | Option::remoteip},
      {"1::", Option::bareip | Option::otherip},
      {"[IPv6:1::]", Option::properip | Option::otherip},
      {"[1::]", Option::properip | Option::otherip},
      {"[::ffff:127.0.0.1]", Option::properip | Option::otherip},
      {"[1::", Option::zero},
      {"[]", Option::nodots},
      {"[mail.example.com]", Option::zero},
  };
  for (auto const& h : helos) {
    CHECK(Rules::helo_shape(h.helo, local, remote) == h.opts)
        << "'" << h.helo << "' is " << Rules::helo_shape(h.helo, local, remote)
        << " not " << h.opts;
  }

  // Over IPv6, the tag or no tag.
  for (auto const helo : {"[IPv6:2001:db8::25]", "[2001:DB8::25]"}) {
    CHECK(Rules::helo_shape(helo, "2001:db8::1", "2001:db8::25")
          == (Option::properip | Option::remoteip))
        << helo;
    CHECK(Rules::helo_shape(helo, "2001:db8::25", "2001:db8::1")
          == (Option::properip | Option::myip))
        << helo;
  }
  CHECK(Rules::helo_shape("2001:db8::25", "2001:db8::1", "2001:db8::25")
        == (Option::bareip | Option::remoteip));

  struct {
    bool   verified;
    bool   nofwd;
    bool   inconsistent;
    Option opts;
  } const rdnss[]{
      {true, false, false, Option::good | Option::exists},
      {false, true, false, Option::noforward | Option::nodns},
      {false, false, true, Option::inconsistent | Option::nodns},
      {false, false, false, Option::nodns},
      {true, true, true,
       Option::exists | Option::noforward | Option::inconsistent},
      {false, true, true,
       Option::nodns | Option::noforward | Option::inconsistent},
  };
  for (auto const& r : rdnss) {
    DNS::Rdns rdns;
    if (r.verified)
      rdns.verified.push_back("mx.example.com");
    if (r.nofwd)
      rdns.nofwd.push_back("gone.example.com");
    if (r.inconsistent)
      rdns.inconsistent.push_back("liar.example.com");
    CHECK(Rules::dns_shape(rdns) == r.opts)
        << Rules::dns_shape(rdns) << " not " << r.opts;
  }

  // With the verb and the domain checks, from a Context.
  DNS::Fake res;
  res.mx_answers["good.example."] = {lookup_status::ok,
                                     {{"mx.good.example.", 10}}};
  res.address_answers["mx.good.example."]
      = {lookup_status::ok, {"93.184.216.34"}};
  res.mx_answers["slow.example."] = {lookup_status::transient, {}};

  Patterns       patterns;
  Rules::Context ctx(res, patterns);
  ctx.local_ip  = local;
  ctx.remote_ip = remote;

  ctx.helo_name = "mail.example.com";
  CHECK(ctx.helo_options() == Option::helo);
  ctx.ehlo = true;
  CHECK(ctx.helo_options() == Option::ehlo);
  ctx.helo_name = "";
  CHECK(ctx.helo_options() == (Option::ehlo | Option::none | Option::nodots));

  CHECK(ctx.address_options("joe@good.example") == Option::domain_valid);
  CHECK(ctx.address_options("joe@GOOD.example") == Option::domain_valid);
  CHECK(ctx.address_options("joe@slow.example") == Option::domain_tempfail);
  CHECK(ctx.address_options("joe@nowhere.example") == Option::domain_invalid);

  // Not plain, no lookup.
  auto const queries{res.queries};
  CHECK(ctx.address_options("joe@nowhere") == Option::unqualified);
  CHECK(ctx.address_options("@a:joe@nowhere.example") == Option::route);
  CHECK(ctx.address_options("") == Option::zero);
  CHECK_EQ(res.queries, queries);

  // Cached.
  CHECK(ctx.address_options("fred@good.example") == Option::domain_valid);
  CHECK_EQ(res.queries, queries);

  ctx.rdns.verified.push_back("mail.example.com");
  CHECK(ctx.dns_options() == (Option::exists | Option::good));
}
