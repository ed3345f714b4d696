#include "Rules-expr.hpp"

#include "DNS-valid.hpp"
#include "IP4.hpp"
#include "Rules-attrs.hpp"
#include "Rules-context.hpp"
#include "Rules-match.hpp"
#include "iequal.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Rules {

bool And::operator==(And const& that) const
{
  return std::equal(begin(terms), end(terms), begin(that.terms),
                    end(that.terms),
                    [](auto const& a, auto const& b) { return *a == *b; });
}

bool Or::operator==(Or const& that) const
{
  return (*left == *that.left) && (*right == *that.right);
}

bool Not::operator==(Not const& that) const { return *term == *that.term; }

std::unique_ptr<Expr> make_expr(Expr::node_t node)
{
  return std::make_unique<Expr>(Expr{std::move(node)});
}

namespace {

// True if any pattern matches.  No patterns at all means we can't
// tell, which is not the same as false.
template <typename Pred>
bool match_patterns(Context& ctx, std::string const& arg, Pred pred)
{
  auto const& patterns = ctx.patterns(arg);
  if (patterns.empty()) {
    ctx.rule_miss = true;
    return false;
  }
  return std::any_of(begin(patterns), end(patterns), pred);
}

bool eval_match(Context& ctx, match_what what, std::string const& arg)
{
  switch (what) {
  case match_what::helo:
    return match_patterns(ctx, arg, [&ctx](auto const& pat) {
      return match_host(ctx.helo_name, pat);
    });

  case match_what::host:
    return match_patterns(ctx, arg, [&ctx](auto const& pat) {
      return std::any_of(begin(ctx.rdns.verified), end(ctx.rdns.verified),
                         [&pat](auto const& host) {
                           return match_host(host, pat);
                         });
    });

  case match_what::from:
    return match_patterns(ctx, arg, [&ctx](auto const& pat) {
      return match_address(ctx.from, pat);
    });

  case match_what::to:
    return match_patterns(ctx, arg, [&ctx](auto const& pat) {
      return match_address(ctx.rcpt_to, pat);
    });

  case match_what::ip:
    return match_patterns(ctx, arg, [&ctx](auto const& pat) {
      return match_ip(ctx.remote_ip, pat);
    });
  }
  LOG(FATAL) << "unknown match_what " << static_cast<int>(what);
}

// Names are looked up relative to the blocklist, so without the root.
void add_name(std::set<std::string>& names, std::string_view name)
{
  if (!DNS::is_domain_name(name))
    return;
  if (name.back() == '.')
    name.remove_suffix(1);
  names.insert(to_lower(name));
}

struct evaluator {
  Context& ctx;

  bool operator()(All const&) const { return true; }

  bool operator()(Tls const& t) const { return t.on == ctx.tls_on; }

  bool operator()(Dnsbl const& d) const
  {
    // Only IPv4 is listed this way.
    if (!IP4::is_address(ctx.remote_ip))
      return false;
    if (!ctx.is_listed(IP4::reverse(ctx.remote_ip) + d.domain))
      return false;
    ctx.add_dnsbl_hit(d.domain);
    return true;
  }

  bool operator()(Dbl const& d) const
  {
    std::set<std::string> names;

    if (test(d.sources, Option::ehlo | Option::helo))
      add_name(names, ctx.helo_name);

    if (test(d.sources, Option::host)) {
      for (auto const* lst :
           {&ctx.rdns.verified, &ctx.rdns.nofwd, &ctx.rdns.inconsistent}) {
        for (auto const& name : *lst)
          add_name(names, name);
      }
    }

    // Only a plain address, one we've looked up the domain of.
    if (test(d.sources, Option::from) && !ctx.from.empty()) {
      if (test(ctx.address_options(ctx.from), Option::domain_checked)) {
        auto const at{ctx.from.rfind('@')};
        add_name(names, std::string_view{ctx.from}.substr(at + 1));
      }
    }

    // Every name is looked up, there's no stopping at the first hit.
    auto hit{false};
    for (auto const& name : names) {
      if (ctx.is_listed(fmt::format("{}.{}", name, d.domain))) {
        ctx.add_dnsbl_hit(d.domain);
        hit = true;
      }
    }
    return hit;
  }

  bool operator()(Match const& m) const { return eval_match(ctx, m.what, m.arg); }

  bool operator()(Source const& s) const
  {
    return eval_match(ctx, match_what::host, s.arg)
           || eval_match(ctx, match_what::helo, s.arg)
           || match_patterns(ctx, s.arg, [this](auto const& pat) {
                return match_from_host(ctx.from, pat);
              });
  }

  bool operator()(Has const& h) const
  {
    switch (h.what) {
    case has_what::helo: return test(ctx.helo_options(), h.opts);
    case has_what::from: return test(ctx.address_options(ctx.from), h.opts);
    case has_what::to: return test(ctx.address_options(ctx.rcpt_to), h.opts);
    case has_what::dns: return test(ctx.dns_options(), h.opts);
    }
    LOG(FATAL) << "unknown has_what " << static_cast<int>(h.what);
  }

  bool operator()(And const& a) const
  {
    return std::all_of(begin(a.terms), end(a.terms),
                       [this](auto const& term) { return term->eval(ctx); });
  }

  bool operator()(Or const& o) const
  {
    return o.left->eval(ctx) || o.right->eval(ctx);
  }

  // Does not clear ctx.rule_miss.
  bool operator()(Not const& n) const { return !n.term->eval(ctx); }
};

option_kind kind_of(has_what what)
{
  switch (what) {
  case has_what::helo: return option_kind::helo;
  case has_what::from: return option_kind::address;
  case has_what::to: return option_kind::address;
  case has_what::dns: return option_kind::dns;
  }
  LOG(FATAL) << "unknown has_what " << static_cast<int>(what);
}

struct renderer {
  std::string operator()(All const&) const { return "all"; }

  std::string operator()(Tls const& t) const
  {
    return t.on ? "tls on" : "tls off";
  }

  std::string operator()(Dnsbl const& d) const
  {
    return fmt::format("dnsbl {}", quote_arg(d.domain));
  }

  std::string operator()(Dbl const& d) const
  {
    return fmt::format("dbl {} {}", option_str(option_kind::dbl, d.sources),
                       quote_arg(d.domain));
  }

  std::string operator()(Match const& m) const
  {
    return fmt::format("{} {}", match_what_c_str(m.what), quote_arg(m.arg));
  }

  std::string operator()(Source const& s) const
  {
    return fmt::format("source {}", quote_arg(s.arg));
  }

  std::string operator()(Has const& h) const
  {
    return fmt::format("{} {}", has_what_c_str(h.what),
                       option_str(kind_of(h.what), h.opts));
  }

  std::string operator()(And const& a) const
  {
    std::string ret{"("};
    for (auto const& term : a.terms) {
      ret += ' ';
      ret += term->str();
    }
    ret += " )";
    return ret;
  }

  std::string operator()(Or const& o) const
  {
    return fmt::format("( {} or {} )", o.left->str(), o.right->str());
  }

  std::string operator()(Not const& n) const
  {
    return fmt::format("not {}", n.term->str());
  }
};

Phase phase_of(Option sources)
{
  if (test(sources, Option::from))
    return Phase::mail_from;
  if (test(sources, Option::ehlo | Option::helo))
    return Phase::helo;
  return Phase::connect;
}

struct requirer {
  Phase operator()(All const&) const { return Phase::any; }

  // TLS is settled, one way or the other, before MAIL FROM.
  Phase operator()(Tls const&) const { return Phase::mail_from; }

  Phase operator()(Dnsbl const&) const { return Phase::connect; }

  Phase operator()(Dbl const& d) const { return phase_of(d.sources); }

  Phase operator()(Match const& m) const
  {
    switch (m.what) {
    case match_what::helo: return Phase::helo;
    case match_what::host: return Phase::connect;
    case match_what::from: return Phase::mail_from;
    case match_what::to: return Phase::rcpt_to;
    case match_what::ip: return Phase::connect;
    }
    LOG(FATAL) << "unknown match_what " << static_cast<int>(m.what);
  }

  Phase operator()(Source const&) const { return Phase::mail_from; }

  Phase operator()(Has const& h) const
  {
    switch (h.what) {
    case has_what::helo: return Phase::helo;
    case has_what::from: return Phase::mail_from;
    case has_what::to: return Phase::rcpt_to;
    case has_what::dns: return Phase::connect;
    }
    LOG(FATAL) << "unknown has_what " << static_cast<int>(h.what);
  }

  Phase operator()(And const& a) const
  {
    auto phase{Phase::any};
    for (auto const& term : a.terms)
      phase = std::max(phase, term->requirement());
    return phase;
  }

  Phase operator()(Or const& o) const
  {
    return std::max(o.left->requirement(), o.right->requirement());
  }

  Phase operator()(Not const& n) const { return n.term->requirement(); }
};

bool is_keyword(std::string_view arg)
{
  return (arg == "or") || (arg == "not") || (arg == "with");
}
} // namespace

bool Expr::eval(Context& ctx) const { return std::visit(evaluator{ctx}, node); }

std::string Expr::str() const { return std::visit(renderer{}, node); }

Phase Expr::requirement() const { return std::visit(requirer{}, node); }

std::ostream& operator<<(std::ostream& os, Expr const& expr)
{
  return os << expr.str();
}

std::string quote_arg(std::string_view arg)
{
  if (!arg.empty() && !is_keyword(arg) && (arg.front() != '#')
      && (arg.find_first_of(" \t\r\n\"\\();") == std::string_view::npos)) {
    return std::string{arg};
  }

  std::string ret{"\""};
  for (auto ch : arg) {
    if ((ch == '"') || (ch == '\\'))
      ret += '\\';
    ret += ch;
  }
  ret += '"';
  return ret;
}

} // namespace Rules
