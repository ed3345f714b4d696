#include "DNS-valid.hpp"

#include "DNS-fake.hpp"
#include "DNS-fcrdns.hpp"

#include <glog/logging.h>

using DNS::lookup_status;
using DNS::validity;

int main(int argc, char* argv[])
{
  DNS::Fake res;

  res.address_answers["mx.good.example."] = {lookup_status::ok, {"93.184.216.34"}};
  res.address_answers["mx6.good.example."] = {lookup_status::ok, {"2001:db8::25"}};
  res.address_answers["mx.private.example."] = {lookup_status::ok, {"10.1.2.3"}};
  res.address_answers["mx.mixed.example."]
      = {lookup_status::ok, {"93.184.216.35", "192.168.1.1"}};
  res.address_answers["mx.loop.example."] = {lookup_status::ok, {"127.0.0.1"}};
  res.address_answers["mx.ula.example."] = {lookup_status::ok, {"fd00::1"}};
  res.address_answers["mx.slow.example."] = {lookup_status::transient, {}};
  res.address_answers["mx.empty.example."] = {lookup_status::ok, {}};

  std::string msg;

  // Plain, a single good MX.
  res.mx_answers["good.example."] = {lookup_status::ok, {{"mx.good.example.", 10}}};
  CHECK(valid_domain(res, "good.example", msg) == validity::good);
  CHECK(msg.empty()) << msg;

  // IPv6 is fine too.
  res.mx_answers["six.example."] = {lookup_status::ok, {{"mx6.good.example.", 10}}};
  CHECK(valid_domain(res, "six.example", msg) == validity::good);

  // RFC 7505 null MX.
  res.mx_answers["null.example."] = {lookup_status::ok, {{".", 0}}};
  CHECK(valid_domain(res, "null.example", msg) == validity::bad);
  CHECK(!msg.empty());

  // A null MX is bad even when there are good ones.
  res.mx_answers["nullmix.example."]
      = {lookup_status::ok, {{"mx.good.example.", 10}, {".", 0}}};
  CHECK(valid_domain(res, "nullmix.example", msg) == validity::bad);

  // Root at some other preference, and localhost.
  res.mx_answers["root.example."] = {lookup_status::ok, {{".", 10}}};
  CHECK(valid_domain(res, "root.example", msg) == validity::bad);
  res.mx_answers["lh.example."] = {lookup_status::ok, {{"LocalHost.", 10}}};
  CHECK(valid_domain(res, "lh.example", msg) == validity::bad);

  // MX pointing at private or loopback space.
  res.mx_answers["priv.example."] = {lookup_status::ok, {{"mx.private.example.", 10}}};
  CHECK(valid_domain(res, "priv.example", msg) == validity::bad);
  res.mx_answers["loop.example."] = {lookup_status::ok, {{"mx.loop.example.", 10}}};
  CHECK(valid_domain(res, "loop.example", msg) == validity::bad);
  res.mx_answers["ula.example."] = {lookup_status::ok, {{"mx.ula.example.", 10}}};
  CHECK(valid_domain(res, "ula.example", msg) == validity::bad);

  // Any bad address spoils the whole MX.
  res.mx_answers["mixed.example."] = {lookup_status::ok, {{"mx.mixed.example.", 10}}};
  CHECK(valid_domain(res, "mixed.example", msg) == validity::bad);

  // MX target with no addresses, or one that doesn't exist.
  res.mx_answers["empty.example."] = {lookup_status::ok, {{"mx.empty.example.", 10}}};
  CHECK(valid_domain(res, "empty.example", msg) == validity::bad);
  res.mx_answers["nx.example."] = {lookup_status::ok, {{"mx.nowhere.example.", 10}}};
  CHECK(valid_domain(res, "nx.example", msg) == validity::bad);

  // Best over all targets: bad < tempfail < good.
  res.mx_answers["best.example."]
      = {lookup_status::ok,
         {{"mx.private.example.", 5}, {"mx.slow.example.", 10}, {"mx.good.example.", 20}}};
  CHECK(valid_domain(res, "best.example", msg) == validity::good);
  CHECK(msg.empty());

  res.mx_answers["temp.example."]
      = {lookup_status::ok, {{"mx.private.example.", 5}, {"mx.slow.example.", 10}}};
  CHECK(valid_domain(res, "temp.example", msg) == validity::tempfail);
  CHECK_NE(msg.find("mx.slow.example."), std::string::npos) << msg;

  // The error kept is from the first target that did best.
  res.mx_answers["twobad.example."]
      = {lookup_status::ok, {{"mx.private.example.", 5}, {"mx.loop.example.", 10}}};
  CHECK(valid_domain(res, "twobad.example", msg) == validity::bad);
  CHECK_NE(msg.find("mx.private.example."), std::string::npos) << msg;

  // Transient failure of the MX lookup.
  res.mx_answers["servfail.example."] = {lookup_status::transient, {}};
  CHECK(valid_domain(res, "servfail.example", msg) == validity::tempfail);

  // No MX: fall back to the domain's own addresses.
  res.address_answers["bare.example."] = {lookup_status::ok, {"93.184.216.36"}};
  CHECK(valid_domain(res, "bare.example", msg) == validity::good);

  res.address_answers["barepriv.example."] = {lookup_status::ok, {"172.16.0.9"}};
  CHECK(valid_domain(res, "barepriv.example", msg) == validity::bad);

  res.address_answers["bareslow.example."] = {lookup_status::transient, {}};
  CHECK(valid_domain(res, "bareslow.example", msg) == validity::tempfail);

  CHECK(valid_domain(res, "nothing.example", msg) == validity::bad);

  // Already rooted, looked up as is.
  CHECK(valid_domain(res, "good.example.", msg) == validity::good);

  // Names no resolver will take are bad without asking.
  auto const queries{res.queries};
  for (auto const name : {"a..b.example", ".example", "good.example..", ".",
                          "", "bad-.example..b"}) {
    CHECK(valid_domain(res, name, msg) == validity::bad) << name;
    CHECK(!msg.empty());
  }
  std::string const long_label(64, 'x');
  CHECK(valid_domain(res, long_label + ".example", msg) == validity::bad);
  CHECK_EQ(res.queries, queries);

  CHECK(DNS::is_domain_name("example"));
  CHECK(DNS::is_domain_name("example.com."));
  CHECK(DNS::is_domain_name(std::string(63, 'x') + ".example"));
  CHECK(!DNS::is_domain_name("example.com.."));
  CHECK(!DNS::is_domain_name(long_label + ".example"));

  std::string big;
  while (big.size() < 250)
    big += "abcdefghi.";
  big += "ab"; // 252
  CHECK(DNS::is_domain_name(big));
  CHECK(DNS::is_domain_name(big + "."));
  CHECK(!DNS::is_domain_name(big + "cd"));

  // check_ip directly.
  CHECK(check_ip(res, "mx.good.example.", msg) == validity::good);
  CHECK(check_ip(res, "mx.slow.example.", msg) == validity::tempfail);
  CHECK(check_ip(res, "mx.loop.example.", msg) == validity::bad);

  // Forward confirmed reverse DNS.
  res.ptr_answers["34.216.184.93.in-addr.arpa"]
      = {lookup_status::ok, {"mx.good.example", "liar.example", "gone.example"}};
  res.address_answers["mx.good.example"] = {lookup_status::ok, {"93.184.216.34"}};
  res.address_answers["liar.example"] = {lookup_status::ok, {"93.184.216.99"}};
  res.address_answers["gone.example"] = {lookup_status::permanent, {}};

  auto const rdns{DNS::fcrdns(res, "93.184.216.34")};
  CHECK_EQ(rdns.verified.size(), 1);
  CHECK_EQ(rdns.verified[0], "mx.good.example");
  CHECK_EQ(rdns.inconsistent.size(), 1);
  CHECK_EQ(rdns.inconsistent[0], "liar.example");
  CHECK_EQ(rdns.nofwd.size(), 1);
  CHECK_EQ(rdns.nofwd[0], "gone.example");

  auto const none{DNS::fcrdns(res, "93.184.216.1")};
  CHECK(none.verified.empty());
  CHECK(none.nofwd.empty());
  CHECK(none.inconsistent.empty());
}
