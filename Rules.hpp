#ifndef RULES_DOT_HPP
#define RULES_DOT_HPP

#include "Rules-expr.hpp"
#include "Rules-phase.hpp"

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace Rules {

class Context;

using with_map = std::map<std::string, std::string>;

// One alternative of a rule: an expression and what to set when it
// matches.  A flag like make-yakker has an empty value.
struct Clause {
  Expr     expr;
  with_map withs;

  std::string str() const;

  bool operator==(Clause const& that) const
  {
    return (expr == that.expr) && (withs == that.withs);
  }
};

class Rule {
public:
  Rule(Action action, Phase deferto, std::vector<Clause> clauses);

  // Clauses in order, first match wins and merges its withs into
  // ctx.with_props.  Any clause that leaves ctx.rule_miss set makes
  // the whole rule a non-match, even if a later clause would match.
  bool check(Context& ctx) const;

  // Should this rule be looked at in phase?
  bool eligible(Phase phase) const;

  Action action() const { return action_; }
  Phase  requirement() const { return requirement_; }
  Phase  deferto() const { return deferto_; }

  std::vector<Clause> const& clauses() const { return clauses_; }

  std::string str() const;

  bool operator==(Rule const& that) const
  {
    return (action_ == that.action_) && (deferto_ == that.deferto_)
           && (clauses_ == that.clauses_);
  }

private:
  std::vector<Clause> clauses_;
  Action              action_;
  Phase               requirement_{Phase::any};
  Phase               deferto_;
};

struct Decision {
  Action   action{Action::accept};
  with_map withs;
};

class Ruleset {
public:
  Ruleset() = default;
  explicit Ruleset(std::vector<Rule> rules);

  // First verdict among the rules eligible in phase, or accept.
  // The decision carries the with properties accumulated so far.
  Decision scan(Context& ctx, Phase phase) const;

  // DATA with these accepted recipients, each put in ctx.rcpt_to and
  // scanned in turn.  The first one that isn't accepted decides.
  Decision scan_data(Context& ctx, std::vector<std::string> const& rcpts) const;

  void append(std::vector<Rule>&& rules);

  std::vector<Rule> const& rules() const { return rules_; }

  bool empty() const { return rules_.empty(); }

  std::string str() const;

private:
  std::vector<Rule> rules_;
};

std::ostream& operator<<(std::ostream& os, Rule const& rule);

} // namespace Rules

#endif // RULES_DOT_HPP
