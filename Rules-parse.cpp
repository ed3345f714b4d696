#include "Rules-parse.hpp"

#include "DNS-valid.hpp"
#include "IP.hpp"
#include "Patterns.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

#include <tao/pegtl.hpp>

namespace fs = std::filesystem;

namespace Rules {

namespace {

enum class tok : uint8_t {
  word,
  quoted,
  lparen,
  rparen,
  semi,
  newline,
};

struct token {
  tok         type;
  std::string text;
  size_t      line;
};

} // namespace

namespace lex {

using namespace tao::pegtl;

// clang-format off

struct ws_char : one<' ', '\t', '\r'> {};

struct line_cont : seq<one<'\\'>, opt<one<'\r'>>, one<'\n'>> {};

struct comment_text : seq<one<'#'>, star<not_one<'\n'>>> {};

struct qchar : sor<seq<one<'\\'>, any>, not_one<'"', '\\'>> {};

struct quoted_str : seq<one<'"'>, star<qchar>, one<'"'>> {};

struct unterminated : seq<one<'"'>, star<qchar>, opt<one<'\\'>>, eof> {};

struct bare_word : plus<not_at<line_cont>,
                        not_one<' ', '\t', '\r', '\n', '"', '(', ')', ';'>> {};

struct lparen_tok : one<'('> {};
struct rparen_tok : one<')'> {};
struct semi_tok : one<';'> {};
struct newline_tok : one<'\n'> {};

struct item : sor<plus<ws_char>,
                  line_cont,
                  comment_text,
                  newline_tok,
                  quoted_str,
                  unterminated,
                  lparen_tok,
                  rparen_tok,
                  semi_tok,
                  bare_word> {};

struct rules_file : seq<star<item>, must<eof>> {};

// clang-format on

template <typename Rule>
struct lex_action : nothing<Rule> {
};

template <>
struct lex_action<bare_word> {
  template <typename Input>
  static void apply(Input const& in, std::vector<token>& toks)
  {
    toks.push_back(token{tok::word, in.string(), in.position().line});
  }
};

template <>
struct lex_action<quoted_str> {
  template <typename Input>
  static void apply(Input const& in, std::vector<token>& toks)
  {
    auto const raw{in.string()};
    std::string text;
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
      if (raw[i] == '\\')
        ++i;
      text += raw[i];
    }
    toks.push_back(token{tok::quoted, std::move(text), in.position().line});
  }
};

template <>
struct lex_action<unterminated> {
  template <typename Input>
  static void apply(Input const& in, std::vector<token>&)
  {
    auto const pos{in.position()};
    throw Rules::parse_error(
        fmt::format("{}:{}: unterminated quoted string", pos.source, pos.line));
  }
};

template <>
struct lex_action<lparen_tok> {
  template <typename Input>
  static void apply(Input const& in, std::vector<token>& toks)
  {
    toks.push_back(token{tok::lparen, "(", in.position().line});
  }
};

template <>
struct lex_action<rparen_tok> {
  template <typename Input>
  static void apply(Input const& in, std::vector<token>& toks)
  {
    toks.push_back(token{tok::rparen, ")", in.position().line});
  }
};

template <>
struct lex_action<semi_tok> {
  template <typename Input>
  static void apply(Input const& in, std::vector<token>& toks)
  {
    toks.push_back(token{tok::semi, ";", in.position().line});
  }
};

template <>
struct lex_action<newline_tok> {
  template <typename Input>
  static void apply(Input const& in, std::vector<token>& toks)
  {
    toks.push_back(token{tok::newline, "\n", in.position().line});
  }
};

} // namespace lex

namespace {

std::vector<token> tokenize(std::string_view text, std::string const& source)
{
  std::vector<token> toks;
  tao::pegtl::memory_input<> in(text.data(), text.size(), source);
  try {
    tao::pegtl::parse<lex::rules_file, lex::lex_action>(in, toks);
  }
  catch (tao::pegtl::parse_error const& e) {
    throw parse_error(e.what());
  }
  return toks;
}

// Words that start a term.
bool is_operator(std::string_view word)
{
  static constexpr char const* ops[]{
      "all", "tls",    "helo",  "ehlo", "host",     "from",   "to",       "ip",
      "source", "dnsbl", "dbl", "from-has", "to-has", "helo-has", "dns",
  };
  return std::find(std::begin(ops), std::end(ops), word) != std::end(ops);
}

// Operators that "or" followed by a bare argument can repeat.
bool is_repeatable(std::string_view word)
{
  static constexpr char const* ops[]{
      "helo", "ehlo", "host", "from", "to", "ip", "source", "dnsbl",
  };
  return std::find(std::begin(ops), std::end(ops), word) != std::end(ops);
}

bool is_reserved(std::string_view word)
{
  return (word == "or") || (word == "not") || (word == "with");
}

std::optional<Phase> find_phase(std::string_view name)
{
  struct phase_name {
    char const* name;
    Phase       phase;
  };
  // clang-format off
  static constexpr phase_name phases[]{
    {"@connect", Phase::connect},
    {"@helo",    Phase::helo},
    {"@from",    Phase::mail_from},
    {"@to",      Phase::rcpt_to},
    {"@data",    Phase::data},
    {"@message", Phase::message},
  };
  // clang-format on
  for (auto const& p : phases) {
    if (name == p.name)
      return p.phase;
  }
  return {};
}

std::optional<Action> find_action(std::string_view name)
{
  if (name == "accept")
    return Action::accept;
  if (name == "reject")
    return Action::reject;
  if (name == "stall")
    return Action::stall;
  if (name == "set-with")
    return Action::set_with;
  return {};
}

// One rule's worth of tokens, newlines already gone.
class rule_parser {
public:
  rule_parser(std::vector<token> const& toks, std::string const& source)
    : toks_(toks)
    , source_(source)
  {
  }

  Rule parse();

private:
  token const* peek() const
  {
    return (pos_ < toks_.size()) ? &toks_[pos_] : nullptr;
  }

  bool at(tok type) const
  {
    return (pos_ < toks_.size()) && (toks_[pos_].type == type);
  }

  bool at_word(std::string_view word) const
  {
    return at(tok::word) && (toks_[pos_].text == word);
  }

  [[noreturn]] void fail(std::string const& msg) const
  {
    auto const line{(pos_ < toks_.size()) ? toks_[pos_].line
                                          : toks_.back().line};
    throw parse_error(fmt::format("{}:{}: {}", source_, line, msg));
  }

  Expr parse_seq();
  Expr parse_or();
  Expr parse_term();
  Expr parse_matcher(std::string const& op);

  std::string parse_arg(std::string const& op);
  Option      parse_options(std::string const& op, option_kind kind);
  with_map    parse_withs();

  std::string host_arg(std::string const& op);
  std::string address_arg(std::string const& op);
  std::string domain_arg(std::string const& op);

  std::vector<token> const& toks_;
  std::string const&        source_;
  size_t                    pos_{0};

  // The simple matcher an "or" with a bare argument repeats.
  std::optional<std::string> last_op_;
};

Rule rule_parser::parse()
{
  auto deferto{Phase::any};

  if (at(tok::word) && (toks_[pos_].text.front() == '@')) {
    auto const phase{find_phase(toks_[pos_].text)};
    if (!phase)
      fail(fmt::format("unknown phase '{}'", toks_[pos_].text));
    deferto = *phase;
    ++pos_;
  }

  auto const* act{peek()};
  if (!act)
    fail("missing action");
  if (act->type != tok::word)
    fail(fmt::format("expected an action, not '{}'", act->text));
  auto const action{find_action(act->text)};
  if (!action)
    fail(fmt::format("unknown action '{}'", act->text));
  ++pos_;

  std::vector<Clause> clauses;
  for (;;) {
    Clause clause{parse_seq(), {}};
    if (at_word("with")) {
      ++pos_;
      clause.withs = parse_withs();
    }

    auto const req{clause.expr.requirement()};
    if ((deferto != Phase::any) && (deferto < req)) {
      fail(fmt::format("{} is too early for \"{}\", it needs {}",
                       phase_c_str(deferto), clause.expr.str(),
                       phase_c_str(req)));
    }
    clauses.push_back(std::move(clause));

    if (!peek())
      break;
    if (!at(tok::semi))
      fail(fmt::format("unexpected '{}'", toks_[pos_].text));
    ++pos_;
    if (!peek())
      fail("nothing after ';'");
  }

  if ((*action == Action::set_with)
      && std::none_of(begin(clauses), end(clauses),
                      [](auto const& c) { return !c.withs.empty(); })) {
    fail("set-with needs a with");
  }

  return Rule{*action, deferto, std::move(clauses)};
}

Expr rule_parser::parse_seq()
{
  std::vector<Expr> terms;
  while (peek() && !at(tok::semi) && !at(tok::rparen) && !at_word("with"))
    terms.push_back(parse_or());

  if (terms.empty())
    fail("empty expression");
  if (terms.size() == 1)
    return std::move(terms.front());

  And seq;
  for (auto& term : terms)
    seq.terms.push_back(make_expr(std::move(term.node)));
  return Expr{std::move(seq)};
}

Expr rule_parser::parse_or()
{
  auto left{parse_term()};
  while (at_word("or")) {
    ++pos_;
    auto const* t{peek()};
    if (!t)
      fail("missing term after 'or'");

    auto const bare{(t->type == tok::quoted)
                    || ((t->type == tok::word) && !is_operator(t->text)
                        && !is_reserved(t->text))};

    auto right{(bare && last_op_) ? parse_matcher(*last_op_) : parse_term()};
    left = Expr{Or{make_expr(std::move(left.node)),
                   make_expr(std::move(right.node))}};
  }
  return left;
}

Expr rule_parser::parse_term()
{
  auto const* t{peek()};
  if (!t)
    fail("missing term");

  switch (t->type) {
  case tok::lparen: {
    ++pos_;
    auto expr{parse_seq()};
    if (!at(tok::rparen))
      fail("missing ')'");
    ++pos_;
    last_op_.reset();
    return expr;
  }
  case tok::quoted: fail(fmt::format("quoted \"{}\" can't be an operator", t->text));
  case tok::word: break;
  default: fail(fmt::format("unexpected '{}'", t->text));
  }

  auto const op{t->text};
  ++pos_;

  if (op == "not") {
    last_op_.reset();
    auto term{parse_term()};
    return Expr{Not{make_expr(std::move(term.node))}};
  }

  if (!is_operator(op)) {
    --pos_;
    fail(fmt::format("unknown operator '{}'", op));
  }

  return parse_matcher(op);
}

std::string rule_parser::parse_arg(std::string const& op)
{
  auto const* t{peek()};
  if (!t || (t->type == tok::lparen) || (t->type == tok::rparen)
      || (t->type == tok::semi)
      || ((t->type == tok::word) && is_reserved(t->text))) {
    fail(fmt::format("missing argument to '{}'", op));
  }
  ++pos_;
  return t->text;
}

std::string rule_parser::host_arg(std::string const& op)
{
  auto arg{parse_arg(op)};
  if (!Patterns::is_file_ref(arg)
      && (arg.empty() || (arg.find('@') != std::string::npos))) {
    --pos_;
    fail(fmt::format("bad host name pattern \"{}\" for '{}'", arg, op));
  }
  return arg;
}

std::string rule_parser::address_arg(std::string const& op)
{
  auto arg{parse_arg(op)};
  if (!Patterns::is_file_ref(arg) && (arg != "<>")
      && (arg.find('@') == std::string::npos)) {
    --pos_;
    fail(fmt::format("bad address pattern \"{}\" for '{}'", arg, op));
  }
  return arg;
}

std::string rule_parser::domain_arg(std::string const& op)
{
  auto arg{parse_arg(op)};
  if (!DNS::is_domain_name(arg)
      || (arg.find_first_of("@/") != std::string::npos)) {
    --pos_;
    fail(fmt::format("bad blocklist domain \"{}\" for '{}'", arg, op));
  }
  return arg;
}

Option rule_parser::parse_options(std::string const& op, option_kind kind)
{
  auto const arg{parse_arg(op)};

  std::vector<std::string> names;
  boost::split(names, arg, boost::is_any_of(","));

  auto opts{Option::zero};
  for (auto const& name : names) {
    if (name.empty()) {
      --pos_;
      fail(fmt::format("empty option in \"{}\" for '{}'", arg, op));
    }
    auto const opt{find_option(kind, name)};
    if (!opt) {
      --pos_;
      fail(fmt::format("unknown option '{}' for '{}'", name, op));
    }
    opts |= *opt;
  }
  return opts;
}

Expr rule_parser::parse_matcher(std::string const& op)
{
  if (is_repeatable(op))
    last_op_ = op;
  else
    last_op_.reset();

  if (op == "all")
    return Expr{All{}};

  if (op == "tls") {
    auto const arg{parse_arg(op)};
    if (arg == "on")
      return Expr{Tls{true}};
    if (arg == "off")
      return Expr{Tls{false}};
    --pos_;
    fail(fmt::format("tls must be on or off, not \"{}\"", arg));
  }

  if ((op == "helo") || (op == "ehlo"))
    return Expr{Match{match_what::helo, host_arg(op)}};
  if (op == "host")
    return Expr{Match{match_what::host, host_arg(op)}};
  if (op == "from")
    return Expr{Match{match_what::from, address_arg(op)}};
  if (op == "to")
    return Expr{Match{match_what::to, address_arg(op)}};

  if (op == "ip") {
    auto arg{parse_arg(op)};
    if (!Patterns::is_file_ref(arg) && !IP::is_network(arg)) {
      --pos_;
      fail(fmt::format("bad IP address pattern \"{}\"", arg));
    }
    return Expr{Match{match_what::ip, std::move(arg)}};
  }

  if (op == "source")
    return Expr{Source{host_arg(op)}};

  if (op == "dnsbl")
    return Expr{Dnsbl{domain_arg(op)}};

  if (op == "dbl") {
    auto const sources{parse_options(op, option_kind::dbl)};
    return Expr{Dbl{sources, domain_arg(op)}};
  }

  if (op == "from-has")
    return Expr{Has{has_what::from, parse_options(op, option_kind::address)}};
  if (op == "to-has")
    return Expr{Has{has_what::to, parse_options(op, option_kind::address)}};
  if (op == "helo-has")
    return Expr{Has{has_what::helo, parse_options(op, option_kind::helo)}};
  if (op == "dns")
    return Expr{Has{has_what::dns, parse_options(op, option_kind::dns)}};

  LOG(FATAL) << "operator " << op << " not handled";
}

with_map rule_parser::parse_withs()
{
  with_map withs;

  while (peek() && !at(tok::semi)) {
    auto const& name{toks_[pos_]};
    if (name.type != tok::word)
      fail(fmt::format("expected a with option, not '{}'", name.text));
    ++pos_;

    if (name.text == "make-yakker") {
      withs[name.text] = "";
      continue;
    }

    if ((name.text != "message") && (name.text != "note")
        && (name.text != "savedir") && (name.text != "tls-opt")) {
      --pos_;
      fail(fmt::format("unknown with option '{}'", name.text));
    }

    auto const* t{peek()};
    if (!t || ((t->type != tok::word) && (t->type != tok::quoted)))
      fail(fmt::format("missing value for '{}'", name.text));
    if (t->text.empty())
      fail(fmt::format("empty value for '{}'", name.text));
    if ((name.text == "note") && (t->text.find('\n') != std::string::npos))
      fail("a note can't have a newline in it");
    if ((name.text == "tls-opt") && (t->text != "off")
        && (t->text != "no-client")) {
      fail(fmt::format("tls-opt must be off or no-client, not \"{}\"",
                       t->text));
    }
    ++pos_;

    withs[name.text] = t->text;
  }

  if (withs.empty())
    fail("nothing after 'with'");

  return withs;
}

using include_stack = std::vector<fs::path>;

std::vector<Rule> parse_text(std::string_view   text,
                             std::string const& source,
                             include_stack&     stack);

std::vector<Rule> parse_path(std::string const& path,
                             std::string const& where,
                             include_stack&     stack)
{
  std::error_code ec;
  auto            canon{fs::weakly_canonical(path, ec)};
  if (ec)
    canon = path;

  if (std::find(begin(stack), end(stack), canon) != end(stack))
    throw parse_error(fmt::format("{}: include loop at {}", where, path));

  std::ifstream ifs(path);
  if (!ifs)
    throw parse_error(fmt::format("{}: can't open rules file {}", where, path));

  std::string const text{std::istreambuf_iterator<char>(ifs),
                         std::istreambuf_iterator<char>()};

  stack.push_back(canon);
  auto rules{parse_text(text, path, stack)};
  stack.pop_back();

  LOG(INFO) << rules.size() << " rules from " << path;
  return rules;
}

std::vector<Rule> parse_text(std::string_view   text,
                             std::string const& source,
                             include_stack&     stack)
{
  std::vector<Rule> rules;

  auto add = [&](std::vector<token> const& stmt) {
    auto const& first{stmt.front()};
    if ((first.type == tok::word) && (first.text == "include")) {
      if ((stmt.size() != 2)
          || ((stmt[1].type != tok::word) && (stmt[1].type != tok::quoted))) {
        throw parse_error(fmt::format("{}:{}: include takes one file name",
                                      source, first.line));
      }
      auto incl{parse_path(stmt[1].text,
                           fmt::format("{}:{}", source, first.line), stack)};
      rules.insert(end(rules), std::make_move_iterator(begin(incl)),
                   std::make_move_iterator(end(incl)));
      return;
    }
    rules.push_back(rule_parser{stmt, source}.parse());
  };

  // A rule ends at a newline, unless the line ends with a ';'.
  std::vector<token> stmt;
  for (auto& t : tokenize(text, source)) {
    if (t.type == tok::newline) {
      if (stmt.empty() || (stmt.back().type == tok::semi))
        continue;
      add(stmt);
      stmt.clear();
      continue;
    }
    stmt.push_back(std::move(t));
  }
  if (!stmt.empty())
    add(stmt);

  return rules;
}

} // namespace

std::vector<Rule> parse(std::string_view text, std::string const& source)
{
  include_stack stack;
  return parse_text(text, source, stack);
}

std::vector<Rule> parse_file(std::string const& path)
{
  include_stack stack;
  return parse_path(path, path, stack);
}

} // namespace Rules
