#include "Rules.hpp"

#include "DNS-fake.hpp"
#include "Patterns.hpp"
#include "Rules-context.hpp"
#include "Rules-load.hpp"
#include "Rules-parse.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include <glog/logging.h>

namespace fs = std::filesystem;

using DNS::lookup_status;
using Rules::Action;
using Rules::Option;
using Rules::Phase;

namespace {
Rules::Ruleset ruleset(char const* text)
{
  return Rules::Ruleset{Rules::parse(text, "t")};
}

// One connection's worth of state.
struct Conn {
  DNS::Fake      res;
  Patterns       patterns;
  Rules::Context ctx{res, patterns};

  Conn()
  {
    ctx.remote_ip = "192.0.2.1";
    ctx.local_ip  = "198.51.100.25";
  }
};

void fbi()
{
  auto const rs{ruleset("reject from info@fbi.gov to joe@example.com")};

  Conn c;
  c.ctx.helo_name = "mail.fbi.gov";
  c.ctx.from      = "info@fbi.gov";

  CHECK(rs.scan(c.ctx, Phase::connect).action == Action::accept);
  CHECK(rs.scan(c.ctx, Phase::helo).action == Action::accept);
  CHECK(rs.scan(c.ctx, Phase::mail_from).action == Action::accept);

  c.ctx.rcpt_to = "joe@example.com";
  CHECK(rs.scan(c.ctx, Phase::rcpt_to).action == Action::reject);
  c.ctx.rcpt_to = "JOE@Example.COM";
  CHECK(rs.scan(c.ctx, Phase::rcpt_to).action == Action::reject);
  c.ctx.rcpt_to = "jane@example.com";
  CHECK(rs.scan(c.ctx, Phase::rcpt_to).action == Action::accept);

  c.ctx.from    = "info@fbi.gov.example";
  c.ctx.rcpt_to = "joe@example.com";
  CHECK(rs.scan(c.ctx, Phase::rcpt_to).action == Action::accept);
}

void friends()
{
  auto const rs{ruleset("accept host .friend.com\nreject all")};

  Conn c;
  c.ctx.rdns.verified.push_back("mail.friend.com");
  for (auto phase : {Phase::connect, Phase::helo, Phase::mail_from,
                     Phase::rcpt_to, Phase::data, Phase::message}) {
    CHECK(rs.scan(c.ctx, phase).action == Action::accept) << phase;
  }

  // Only an unverified name.
  Conn s;
  s.ctx.rdns.inconsistent.push_back("mail.friend.com");
  CHECK(rs.scan(s.ctx, Phase::connect).action == Action::reject);

  // Pinned to one phase, it's only checked then.
  auto const pinned{ruleset("@helo accept host .friend.com\nreject all")};
  CHECK(pinned.scan(c.ctx, Phase::connect).action == Action::reject);
  CHECK(pinned.scan(c.ctx, Phase::helo).action == Action::accept);
  CHECK(pinned.scan(c.ctx, Phase::mail_from).action == Action::reject);
}

void set_with()
{
  auto const compact{ruleset(
      "set-with from @a.b with message \"Hi\"; all with message \"Bye\"")};
  auto const separate{ruleset("set-with from @a.b with message \"Hi\"\n"
                              "set-with all with message \"Bye\"")};

  for (auto const& [from, compact_msg] :
       {std::pair{"joe@a.b", "Hi"}, std::pair{"joe@c.d", "Bye"}}) {
    Conn c;
    c.ctx.from = from;
    auto const d{compact.scan(c.ctx, Phase::mail_from)};
    CHECK(d.action == Action::accept);
    CHECK_EQ(d.withs.at("message"), compact_msg);

    // The later rule always wins.
    Conn s;
    s.ctx.from = from;
    CHECK_EQ(separate.scan(s.ctx, Phase::mail_from).withs.at("message"), "Bye");
  }

  // Carried along to the rule with the verdict.
  auto const carried{ruleset("set-with all with note \"seen\"\n"
                             "reject from a@b.c with message \"go away\"")};
  Conn c;
  CHECK(carried.scan(c.ctx, Phase::connect).action == Action::accept);
  CHECK_EQ(c.ctx.with_props.at("note"), "seen");
  c.ctx.from = "a@b.c";
  auto const d{carried.scan(c.ctx, Phase::mail_from)};
  CHECK(d.action == Action::reject);
  CHECK_EQ(d.withs.size(), 2);
  CHECK_EQ(d.withs.at("note"), "seen");
  CHECK_EQ(d.withs.at("message"), "go away");
}

void missing_patterns()
{
  constexpr auto missing{"/nonexistent/Rules-test/list"};

  // The right side of the or is never looked at.
  auto const guarded{
      ruleset("accept all or from /nonexistent/Rules-test/list\nreject all")};
  Conn c;
  c.ctx.from = "joe@example.com";
  CHECK(guarded.scan(c.ctx, Phase::mail_from).action == Action::accept);
  CHECK(!c.ctx.rule_miss);

  // Nothing to match against: the rule is skipped, not negated.
  auto const negated{ruleset(
      "reject not from /nonexistent/Rules-test/list\naccept all")};
  CHECK(negated.scan(c.ctx, Phase::mail_from).action == Action::accept);

  // The first clause drops the whole rule, the second clause would
  // have matched on its own.
  auto const compact{ruleset(
      "reject from /nonexistent/Rules-test/list; all\nstall all")};
  CHECK(compact.scan(c.ctx, Phase::mail_from).action == Action::stall);

  // In the other order the first clause matches before the miss.
  auto const reversed{ruleset(
      "reject all; from /nonexistent/Rules-test/list\nstall all")};
  CHECK(reversed.scan(c.ctx, Phase::mail_from).action == Action::reject);

  CHECK(c.patterns.resolve(missing).empty());
}

void pattern_files(fs::path const& dir)
{
  auto const users{dir / "users"};
  {
    std::ofstream ofs(users);
    ofs << "# who we take mail for\n"
           "joe@example.com\n"
           "\n"
           "  @sales.example.com  \n";
  }

  auto const rs{ruleset(
      ("reject not to " + Rules::quote_arg("file:" + users.string())).c_str())};

  Conn c;
  for (auto const& [rcpt, action] :
       {std::pair{"joe@example.com", Action::accept},
        std::pair{"bob@sales.example.com", Action::accept},
        std::pair{"bob@example.com", Action::reject}}) {
    c.ctx.rcpt_to = rcpt;
    CHECK(rs.scan(c.ctx, Phase::rcpt_to).action == action) << rcpt;
  }
}

void blocklists()
{
  {
    auto const rs{ruleset("reject dnsbl zen.example\n"
                          "reject dnsbl other.example")};
    Conn c;
    c.res.listed_names.insert("1.2.0.192.zen.example");
    CHECK(rs.scan(c.ctx, Phase::connect).action == Action::reject);
    CHECK_EQ(c.ctx.dnsbl_hits.size(), 1);
    CHECK_EQ(c.ctx.dnsbl_hits[0], "zen.example");

    // Cached.
    auto const queries{c.res.listed_queries};
    CHECK(rs.scan(c.ctx, Phase::helo).action == Action::reject);
    CHECK_EQ(c.res.listed_queries, queries);

    Conn v6;
    v6.ctx.remote_ip = "2001:db8::1";
    CHECK(rs.scan(v6.ctx, Phase::connect).action == Action::accept);
    CHECK_EQ(v6.res.listed_queries, 0);
  }

  {
    auto const rs{ruleset("reject dbl helo,host dbl.example")};
    Conn c;
    c.ctx.helo_name = "Mail.Example.COM";
    c.ctx.rdns.nofwd.push_back("bad.host.example.");
    c.ctx.rdns.verified.push_back("mail.example.com");
    c.res.listed_names.insert("bad.host.example.dbl.example");

    // Not yet.
    CHECK(rs.scan(c.ctx, Phase::connect).action == Action::accept);

    CHECK(rs.scan(c.ctx, Phase::helo).action == Action::reject);
    CHECK_EQ(c.ctx.dnsbl_hits.size(), 1);
    CHECK_EQ(c.ctx.dnsbl_hits[0], "dbl.example");
    // mail.example.com, the same from helo and host, and bad.host.example.
    CHECK_EQ(c.res.listed_queries, 2);
  }

  {
    auto const rs{ruleset("reject dbl from dbl.example")};
    Conn c;
    c.res.listed_names.insert("spammer.example.dbl.example");
    c.res.listed_names.insert("nodots.dbl.example");

    c.ctx.from = "joe@Spammer.Example";
    CHECK(rs.scan(c.ctx, Phase::mail_from).action == Action::reject);

    // Not a plain address, the domain is not looked at.
    Conn u;
    u.res.listed_names = c.res.listed_names;
    u.ctx.from         = "joe@nodots";
    CHECK(rs.scan(u.ctx, Phase::mail_from).action == Action::accept);
    CHECK_EQ(u.res.listed_queries, 0);
  }
}

void malformed_names()
{
  // Every plain address is looked up, whatever it looks like.
  {
    auto const rs{ruleset("reject from-has bad,route\n"
                          "reject to-has bad,route")};
    Conn c;
    c.res.mx_answers["example.com."]
        = {lookup_status::ok, {{"mx.example.com.", 10}}};
    c.res.address_answers["mx.example.com."]
        = {lookup_status::ok, {"93.184.216.34"}};

    c.ctx.from = "joe@example.com.";
    CHECK(rs.scan(c.ctx, Phase::mail_from).action == Action::accept);
    CHECK(c.ctx.address_options(c.ctx.from) == Option::domain_valid);

    auto const queries{c.res.queries};
    c.ctx.rcpt_to = "jane@a..b.example";
    CHECK(rs.scan(c.ctx, Phase::rcpt_to).action == Action::accept);
    CHECK(c.ctx.address_options(c.ctx.rcpt_to) == Option::domain_invalid);
    c.ctx.rcpt_to = "jane@example.com..";
    CHECK(rs.scan(c.ctx, Phase::rcpt_to).action == Action::accept);
    CHECK_EQ(c.res.queries, queries);
  }

  {
    auto const rs{ruleset("reject from-has baddom")};
    Conn c;
    c.ctx.from = "joe@a..b.example";
    CHECK(rs.scan(c.ctx, Phase::mail_from).action == Action::reject);
    CHECK_EQ(c.res.queries, 0);
  }

  // Nothing that isn't a domain name goes in front of a blocklist.
  {
    auto const rs{ruleset("reject dbl helo dbl.example")};
    for (auto const helo : {".", "a..b", ".example", "example.."}) {
      Conn c;
      c.ctx.helo_name = helo;
      CHECK(rs.scan(c.ctx, Phase::helo).action == Action::accept) << helo;
      CHECK_EQ(c.res.listed_queries, 0) << helo;
    }

    Conn c;
    c.ctx.helo_name = "Mail.Spam.Example.";
    c.res.listed_names.insert("mail.spam.example.dbl.example");
    CHECK(rs.scan(c.ctx, Phase::helo).action == Action::reject);
    CHECK_EQ(c.res.listed_queries, 1);
  }

  {
    auto const rs{ruleset("reject dbl from dbl.example")};
    Conn c;
    c.res.listed_names.insert("spammer.example.dbl.example");
    c.ctx.from = "joe@spammer.example.";
    CHECK(rs.scan(c.ctx, Phase::mail_from).action == Action::reject);

    Conn m;
    m.ctx.from = "joe@a..b.example";
    CHECK(rs.scan(m.ctx, Phase::mail_from).action == Action::accept);
    CHECK_EQ(m.res.listed_queries, 0);
    CHECK_EQ(m.res.queries, 0);
  }
}

void misc_matchers()
{
  auto const tls{ruleset("reject tls off")};
  Conn c;
  CHECK(tls.scan(c.ctx, Phase::connect).action == Action::accept);
  CHECK(tls.scan(c.ctx, Phase::mail_from).action == Action::reject);
  c.ctx.tls_on = true;
  CHECK(tls.scan(c.ctx, Phase::mail_from).action == Action::accept);

  auto const source{ruleset("reject source .spam.example")};
  Conn h;
  h.ctx.helo_name = "mx1.spam.example";
  CHECK(source.scan(h.ctx, Phase::mail_from).action == Action::reject);
  Conn f;
  f.ctx.helo_name = "mx1.ham.example";
  f.ctx.from      = "joe@spam.example";
  CHECK(source.scan(f.ctx, Phase::mail_from).action == Action::reject);
  f.ctx.from = "joe@ham.example";
  CHECK(source.scan(f.ctx, Phase::mail_from).action == Action::accept);

  auto const ip{ruleset("accept ip 192.0.2.0/24\nreject all")};
  Conn i;
  CHECK(ip.scan(i.ctx, Phase::connect).action == Action::accept);
  i.ctx.remote_ip = "192.0.3.1";
  CHECK(ip.scan(i.ctx, Phase::connect).action == Action::reject);

  auto const dns{ruleset("stall dns nodns")};
  Conn d;
  CHECK(dns.scan(d.ctx, Phase::connect).action == Action::stall);
  d.ctx.rdns.verified.push_back("mail.example.com");
  CHECK(dns.scan(d.ctx, Phase::connect).action == Action::accept);

  auto const helo{ruleset("reject helo-has bareip,bogus")};
  Conn b;
  b.ctx.helo_name = "192.0.2.1";
  CHECK(helo.scan(b.ctx, Phase::helo).action == Action::reject);
  b.ctx.helo_name = "[192.0.2.1]";
  CHECK(helo.scan(b.ctx, Phase::helo).action == Action::accept);
}

void data_phase()
{
  auto const rs{ruleset("@data reject to spam@example.com")};

  Conn c;
  auto const d{rs.scan_data(c.ctx, {"joe@example.com", "spam@example.com",
                                     "bob@example.com"})};
  CHECK(d.action == Action::reject);
  CHECK_EQ(c.ctx.rcpt_to, "spam@example.com");

  CHECK(rs.scan_data(c.ctx, {"joe@example.com"}).action == Action::accept);

  CHECK(rs.scan_data(c.ctx, {}).action == Action::accept);
  CHECK(c.ctx.rcpt_to.empty());
}

void loading(fs::path const& dir)
{
  Rules::Config config;

  auto const std_rules{Rules::build(config)};
  CHECK_EQ(std_rules.rules().size(), 3);

  Conn c;
  CHECK(std_rules.scan(c.ctx, Phase::connect).action == Action::accept);
  CHECK(std_rules.scan(c.ctx, Phase::helo).action == Action::reject);
  c.ctx.helo_name = "mail.example.com";
  CHECK(std_rules.scan(c.ctx, Phase::helo).action == Action::accept);
  c.ctx.from = "joe@nodots";
  CHECK(std_rules.scan(c.ctx, Phase::mail_from).action == Action::reject);
  c.ctx.from = "@route:joe@example.com";
  CHECK(std_rules.scan(c.ctx, Phase::mail_from).action == Action::reject);
  c.ctx.from = "joe@example.com";
  CHECK(std_rules.scan(c.ctx, Phase::mail_from).action == Action::accept);

  auto const heloreject{dir / "helos"};
  {
    std::ofstream ofs(heloreject);
    ofs << ".bad.example\n";
  }
  auto const site{dir / "site.rules"};
  {
    std::ofstream ofs(site);
    ofs << "# site rules\n"
           "reject from @spam.example\n";
  }

  config.std_rules      = false;
  config.reject_message = true;
  config.heloreject     = heloreject.string();
  config.files.push_back(site.string());

  auto const rs{Rules::build(config)};
  CHECK_EQ(rs.rules().size(), 3);
  CHECK_EQ(rs.rules()[0].str(), "@message reject all");
  CHECK_EQ(rs.rules()[1].str(),
           "@from reject helo " + Rules::quote_arg("file:" + heloreject.string()));
  CHECK_EQ(rs.rules()[2].str(), "reject from @spam.example");

  Conn h;
  h.ctx.helo_name = "mx.bad.example";
  CHECK(rs.scan(h.ctx, Phase::helo).action == Action::accept);
  CHECK(rs.scan(h.ctx, Phase::mail_from).action == Action::reject);
  h.ctx.helo_name = "mx.good.example";
  CHECK(rs.scan(h.ctx, Phase::mail_from).action == Action::accept);
  CHECK(rs.scan(h.ctx, Phase::message).action == Action::reject);

  // Anything wrong, stall everything.
  config.files.push_back((dir / "nope.rules").string());
  try {
    Rules::build(config);
    LOG(FATAL) << "no error for a missing rules file";
  }
  catch (Rules::parse_error const& e) {
    CHECK(std::string_view{e.what()}.find("nope.rules") != std::string_view::npos);
  }

  for (auto i = 0; i < 2; ++i) {
    auto const stall{Rules::load_or_stall(config)};
    CHECK_EQ(stall.rules().size(), 1);
    CHECK_EQ(stall.str(), "stall all\n");
    Conn s;
    CHECK(stall.scan(s.ctx, Phase::connect).action == Action::stall);
  }

  // A blocklist that can't be looked up is an error in the file.
  auto const dnsbl{dir / "dnsbl.rules"};
  {
    std::ofstream ofs(dnsbl);
    ofs << "reject dnsbl zen..example\n";
  }
  config.files = {dnsbl.string()};
  CHECK_EQ(Rules::load_or_stall(config).str(), "stall all\n");
}
} // namespace

int main(int argc, char* argv[])
{
  auto const dir{fs::temp_directory_path()
                 / ("Rules-test." + std::to_string(getpid()))};
  fs::create_directories(dir);

  fbi();
  friends();
  set_with();
  missing_patterns();
  pattern_files(dir);
  blocklists();
  malformed_names();
  misc_matchers();
  data_phase();
  loading(dir);

  fs::remove_all(dir);
}
