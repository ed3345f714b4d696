#include "Rules.hpp"

#include "Rules-context.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Rules {

std::string Clause::str() const
{
  auto ret{expr.str()};
  if (!withs.empty()) {
    ret += " with";
    for (auto const& [name, value] : withs) {
      ret += ' ';
      ret += name;
      if (!value.empty()) {
        ret += ' ';
        ret += '"';
        for (auto ch : value) {
          if ((ch == '"') || (ch == '\\'))
            ret += '\\';
          ret += ch;
        }
        ret += '"';
      }
    }
  }
  return ret;
}

Rule::Rule(Action action, Phase deferto, std::vector<Clause> clauses)
  : clauses_(std::move(clauses))
  , action_(action)
  , deferto_(deferto)
{
  CHECK(!clauses_.empty());
  for (auto const& clause : clauses_)
    requirement_ = std::max(requirement_, clause.expr.requirement());
  CHECK((deferto_ == Phase::any) || (deferto_ >= requirement_))
      << "rule at " << deferto_ << " needs " << requirement_;
}

bool Rule::check(Context& ctx) const
{
  ctx.rule_miss = false;

  for (auto const& clause : clauses_) {
    auto const matched{clause.expr.eval(ctx)};
    if (ctx.rule_miss)
      return false;
    if (matched) {
      for (auto const& [name, value] : clause.withs)
        ctx.with_props[name] = value;
      return true;
    }
  }

  return false;
}

bool Rule::eligible(Phase phase) const
{
  if (requirement_ > phase)
    return false;
  return (deferto_ == Phase::any) || (deferto_ == phase);
}

std::string Rule::str() const
{
  std::string ret;
  if (deferto_ != Phase::any) {
    ret += phase_c_str(deferto_);
    ret += ' ';
  }
  ret += action_c_str(action_);
  auto sep{" "};
  for (auto const& clause : clauses_) {
    ret += sep;
    ret += clause.str();
    sep = "; ";
  }
  return ret;
}

std::ostream& operator<<(std::ostream& os, Rule const& rule)
{
  return os << rule.str();
}

Ruleset::Ruleset(std::vector<Rule> rules)
  : rules_(std::move(rules))
{
}

void Ruleset::append(std::vector<Rule>&& rules)
{
  rules_.insert(end(rules_), std::make_move_iterator(begin(rules)),
                std::make_move_iterator(end(rules)));
}

Decision Ruleset::scan(Context& ctx, Phase phase) const
{
  for (auto const& rule : rules_) {
    if (!rule.eligible(phase) || !rule.check(ctx))
      continue;

    if (rule.action() == Action::set_with) {
      VLOG(1) << phase << " set-with matched: " << rule;
      continue;
    }

    LOG(INFO) << phase << " " << rule.action() << " by rule: " << rule;
    return Decision{rule.action(), ctx.with_props};
  }

  return Decision{Action::accept, ctx.with_props};
}

Decision Ruleset::scan_data(Context&                        ctx,
                            std::vector<std::string> const& rcpts) const
{
  if (rcpts.empty()) {
    ctx.rcpt_to.clear();
    return scan(ctx, Phase::data);
  }

  Decision decision;
  for (auto const& rcpt : rcpts) {
    ctx.rcpt_to = rcpt;
    decision    = scan(ctx, Phase::data);
    if (decision.action != Action::accept)
      break;
  }
  return decision;
}

std::string Ruleset::str() const
{
  std::string ret;
  for (auto const& rule : rules_) {
    ret += rule.str();
    ret += '\n';
  }
  return ret;
}

} // namespace Rules
