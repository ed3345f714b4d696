#include <gflags/gflags.h>
namespace gflags {
}

DEFINE_string(ip, "127.0.0.1", "remote IP address of the client");
DEFINE_string(local_ip, "127.0.0.1", "our IP address");
DEFINE_string(helo, "", "HELO or EHLO name sent by the client");
DEFINE_string(helo_verb, "ehlo", "helo or ehlo");
DEFINE_string(from, "", "MAIL FROM address");
DEFINE_string(to, "", "comma separated RCPT TO addresses");
DEFINE_bool(tls, false, "client has started TLS");
DEFINE_bool(dump, false, "print the loaded rules and exit");

#include "DNS-fcrdns.hpp"
#include "DNS-ldns.hpp"
#include "IP.hpp"
#include "Patterns.hpp"
#include "Rules-context.hpp"
#include "Rules-load.hpp"
#include "Rules-parse.hpp"
#include "iequal.hpp"

#include <iostream>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
void print(Rules::Phase phase, Rules::Decision const& decision)
{
  std::cout << fmt::format("{:<9} {}", Rules::phase_c_str(phase),
                           Rules::action_c_str(decision.action));
  for (auto const& [name, value] : decision.withs) {
    std::cout << ' ' << name;
    if (!value.empty())
      std::cout << '=' << Rules::quote_arg(value);
  }
  std::cout << '\n';
}

bool verdict(Rules::Decision const& decision)
{
  return (decision.action == Rules::Action::reject)
         || (decision.action == Rules::Action::stall);
}
} // namespace

int main(int argc, char* argv[])
{
  {
    using namespace gflags;
    ParseCommandLineFlags(&argc, &argv, true);
  }
  google::InitGoogleLogging(argv[0]);

  if (!iequal(FLAGS_helo_verb, "helo") && !iequal(FLAGS_helo_verb, "ehlo")) {
    LOG(ERROR) << "--helo_verb must be helo or ehlo, not " << FLAGS_helo_verb;
    return 2;
  }

  Rules::Ruleset ruleset;
  try {
    ruleset = Rules::build(Rules::config_from_flags());
  }
  catch (Rules::parse_error const& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  if (FLAGS_dump) {
    std::cout << ruleset.str();
    return 0;
  }

  DNS_ldns::Resolver res;
  Patterns           patterns;
  Rules::Context     ctx(res, patterns);

  ctx.remote_ip = FLAGS_ip;
  ctx.local_ip  = FLAGS_local_ip;
  if (IP::is_address(ctx.remote_ip))
    ctx.rdns = DNS::fcrdns(res, ctx.remote_ip);
  else
    LOG(WARNING) << "not an IP address: " << ctx.remote_ip;

  for (auto const& name : ctx.rdns.verified)
    std::cout << "verified  " << name << '\n';
  for (auto const& name : ctx.rdns.nofwd)
    std::cout << "noforward " << name << '\n';
  for (auto const& name : ctx.rdns.inconsistent)
    std::cout << "bad fwd   " << name << '\n';

  auto decision{ruleset.scan(ctx, Rules::Phase::connect)};
  print(Rules::Phase::connect, decision);
  if (verdict(decision))
    return 0;

  ctx.helo_name = FLAGS_helo;
  ctx.ehlo      = iequal(FLAGS_helo_verb, "ehlo");
  decision      = ruleset.scan(ctx, Rules::Phase::helo);
  print(Rules::Phase::helo, decision);
  if (verdict(decision))
    return 0;

  ctx.tls_on = FLAGS_tls;
  ctx.from   = FLAGS_from;
  decision   = ruleset.scan(ctx, Rules::Phase::mail_from);
  print(Rules::Phase::mail_from, decision);
  if (verdict(decision))
    return 0;

  std::vector<std::string> rcpts;
  if (!FLAGS_to.empty())
    boost::split(rcpts, FLAGS_to, boost::is_any_of(","));

  // A refused recipient drops out, the rest carry on.
  std::vector<std::string> accepted;
  for (auto const& rcpt : rcpts) {
    ctx.rcpt_to = rcpt;
    decision    = ruleset.scan(ctx, Rules::Phase::rcpt_to);
    std::cout << rcpt << ":\n";
    print(Rules::Phase::rcpt_to, decision);
    if (!verdict(decision))
      accepted.push_back(rcpt);
  }
  if (!rcpts.empty() && accepted.empty())
    return 0;

  decision = ruleset.scan_data(ctx, accepted);
  print(Rules::Phase::data, decision);
  if (verdict(decision))
    return 0;

  decision = ruleset.scan(ctx, Rules::Phase::message);
  print(Rules::Phase::message, decision);

  if (!ctx.dnsbl_hits.empty()) {
    std::cout << "listed by";
    for (auto const& hit : ctx.dnsbl_hits)
      std::cout << ' ' << hit;
    std::cout << '\n';
  }
}
