#ifndef RULES_EXPR_DOT_HPP
#define RULES_EXPR_DOT_HPP

#include "Rules-option.hpp"
#include "Rules-phase.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace Rules {

class Context;
struct Expr;

// Which getter a pattern match uses.
enum class match_what : uint8_t {
  helo, // the HELO name
  host, // verified reverse DNS names
  from, // MAIL FROM
  to,   // RCPT TO
  ip,   // remote IP
};

// Which attributes a *-has test looks at.
enum class has_what : uint8_t {
  helo,
  from,
  to,
  dns,
};

constexpr char const* match_what_c_str(match_what what)
{
  switch (what) { // clang-format off
  case match_what::helo: return "helo";
  case match_what::host: return "host";
  case match_what::from: return "from";
  case match_what::to:   return "to";
  case match_what::ip:   return "ip";
  } // clang-format on
  return "*** unknown match_what ***";
}

constexpr char const* has_what_c_str(has_what what)
{
  switch (what) { // clang-format off
  case has_what::helo: return "helo-has";
  case has_what::from: return "from-has";
  case has_what::to:   return "to-has";
  case has_what::dns:  return "dns";
  } // clang-format on
  return "*** unknown has_what ***";
}

// The nodes.

struct All {
  bool operator==(All const&) const = default;
};

struct Tls {
  bool on{false};
  bool operator==(Tls const&) const = default;
};

// Remote IPv4 address listed in a DNSBL.
struct Dnsbl {
  std::string domain;
  bool        operator==(Dnsbl const&) const = default;
};

// HELO name, reverse DNS names or MAIL FROM domain listed in a
// domain blocklist.
struct Dbl {
  Option      sources{Option::zero};
  std::string domain;
  bool        operator==(Dbl const&) const = default;
};

struct Match {
  match_what  what;
  std::string arg;
  bool        operator==(Match const&) const = default;
};

// host, helo or MAIL FROM domain.
struct Source {
  std::string arg;
  bool        operator==(Source const&) const = default;
};

struct Has {
  has_what what;
  Option   opts{Option::zero};
  bool     operator==(Has const&) const = default;
};

struct And {
  std::vector<std::unique_ptr<Expr>> terms;
  bool                               operator==(And const& that) const;
};

struct Or {
  std::unique_ptr<Expr> left;
  std::unique_ptr<Expr> right;
  bool                  operator==(Or const& that) const;
};

struct Not {
  std::unique_ptr<Expr> term;
  bool                  operator==(Not const& that) const;
};

struct Expr {
  using node_t
      = std::variant<All, Tls, Dnsbl, Dbl, Match, Source, Has, And, Or, Not>;

  node_t node;

  bool eval(Context& ctx) const;

  // Canonical text, parses back to an equal Expr.
  std::string str() const;

  // The earliest phase all the data this needs is available.
  Phase requirement() const;

  bool operator==(Expr const& that) const { return node == that.node; }
};

std::unique_ptr<Expr> make_expr(Expr::node_t node);

std::ostream& operator<<(std::ostream& os, Expr const& expr);

// An argument as it must be written to read back the same.
std::string quote_arg(std::string_view arg);

} // namespace Rules

#endif // RULES_EXPR_DOT_HPP
