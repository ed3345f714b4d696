#include "Rules-parse.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include <glog/logging.h>

namespace fs = std::filesystem;

using Rules::Phase;

namespace {
Rules::Rule parse_one(char const* text)
{
  auto rules{Rules::parse(text, "t")};
  CHECK_EQ(rules.size(), 1) << text;
  return std::move(rules.front());
}

void fails(char const* text, char const* why)
{
  try {
    Rules::parse(text, "t");
  }
  catch (Rules::parse_error const& e) {
    CHECK(std::string_view{e.what()}.find(why) != std::string_view::npos)
        << "\"" << text << "\" failed with \"" << e.what()
        << "\", expected \"" << why << "\"";
    return;
  }
  LOG(FATAL) << "no parse error for \"" << text << "\"";
}

void write_file(fs::path const& path, char const* text)
{
  std::ofstream ofs(path);
  CHECK(ofs) << "can't write " << path;
  ofs << text;
}
} // namespace

int main(int argc, char* argv[])
{
  struct {
    char const* text;
    char const* canonical;
  } const forms[]{
      {"reject from info@fbi.gov to joe@example.com",
       "reject ( from info@fbi.gov to joe@example.com )"},
      {"accept host .friend.com", "accept host .friend.com"},
      {"set-with from @a.b with message \"Hi\"; all with message \"Bye\"",
       "set-with from @a.b with message \"Hi\"; all with message \"Bye\""},
      {"accept to a@b.c or d@e.f", "accept ( to a@b.c or to d@e.f )"},
      {"accept from a@b.c or \"x y@z.w\"",
       "accept ( from a@b.c or from \"x y@z.w\" )"},
      {"@to reject not to file:/etc/sink/users",
       "@to reject not to file:/etc/sink/users"},
      {"accept helo-has bareip,myip", "accept helo-has bareip,myip"},
      {"accept helo-has myip,ip", "accept helo-has ip,myip"},
      {"reject from-has route,garbage,noat,unqualified", "reject from-has bad"},
      {"reject dbl ehlo,host dbl.example", "reject dbl helo,host dbl.example"},
      {"reject dbl host,from,helo dbl.example", "reject dbl any dbl.example"},
      {"reject dnsbl zen.example", "reject dnsbl zen.example"},
      {"reject dnsbl zen.example.", "reject dnsbl zen.example."},
      {"stall dns nodns", "stall dns nodns"},
      {"accept tls on", "accept tls on"},
      {"accept ip 10.0.0.0/8", "accept ip 10.0.0.0/8"},
      {"accept ehlo mail.example.com", "accept helo mail.example.com"},
      {"accept source .example.com", "accept source .example.com"},
      {"reject ( helo a.b or c.d ) from @x.y",
       "reject ( ( helo a.b or helo c.d ) from @x.y )"},
      {"accept not from a@b.c or to d@e.f",
       "accept ( not from a@b.c or to d@e.f )"},
      {"accept not ( from a@b.c to d@e.f )",
       "accept not ( from a@b.c to d@e.f )"},
      {"accept all with note n message m make-yakker",
       "accept all with make-yakker message \"m\" note \"n\""},
      {"@from reject helo x.y", "@from reject helo x.y"},
      {"@message stall all with tls-opt no-client savedir /var/sink",
       "@message stall all with savedir \"/var/sink\" tls-opt \"no-client\""},
      {"accept ( ( all ) )", "accept all"},
  };
  for (auto const& f : forms) {
    auto const rule{parse_one(f.text)};
    CHECK_EQ(rule.str(), f.canonical);

    // The canonical text reads back the same.
    auto const again{parse_one(rule.str().c_str())};
    CHECK(again == rule) << rule.str() << " != " << again.str();
  }

  auto const fbi{parse_one("reject from info@fbi.gov to joe@example.com")};
  CHECK(fbi.requirement() == Phase::rcpt_to);
  CHECK(fbi.deferto() == Phase::any);
  CHECK(fbi.action() == Rules::Action::reject);
  CHECK(!fbi.eligible(Phase::mail_from));
  CHECK(fbi.eligible(Phase::rcpt_to));
  CHECK(fbi.eligible(Phase::data));

  auto const pinned{parse_one("@from reject helo x.y")};
  CHECK(pinned.requirement() == Phase::helo);
  CHECK(pinned.deferto() == Phase::mail_from);
  CHECK(!pinned.eligible(Phase::helo));
  CHECK(pinned.eligible(Phase::mail_from));
  CHECK(!pinned.eligible(Phase::rcpt_to));

  CHECK(parse_one("reject dbl host x.y").requirement() == Phase::connect);
  CHECK(parse_one("reject dbl helo x.y").requirement() == Phase::helo);
  CHECK(parse_one("reject dbl any x.y").requirement() == Phase::mail_from);
  CHECK(parse_one("reject tls off").requirement() == Phase::mail_from);
  CHECK(parse_one("reject all").requirement() == Phase::any);

  // Escapes in quoted strings.
  auto const esc{parse_one(R"(accept all with message "say \"hi\" \\ ok")")};
  CHECK_EQ(esc.clauses()[0].withs.at("message"), R"(say "hi" \ ok)");
  CHECK(parse_one(esc.str().c_str()) == esc);

  // Comments, blank lines and an empty file.
  CHECK(Rules::parse("", "t").empty());
  CHECK(Rules::parse("# nothing here\n\n   \n", "t").empty());
  auto const commented{
      Rules::parse("# first\n\naccept all # the rest\n\n# done", "t")};
  CHECK_EQ(commented.size(), 1);
  CHECK_EQ(commented[0].str(), "accept all");

  // Backslash newline joins lines.
  auto const joined{Rules::parse("reject from a@b.c \\\n  to d@e.f\n", "t")};
  CHECK_EQ(joined.size(), 1);
  CHECK(joined[0] == parse_one("reject from a@b.c to d@e.f"));

  // A line ending with ';' continues the rule.
  auto const compact{Rules::parse("accept from a@b.c;\n  to d@e.f\n", "t")};
  CHECK_EQ(compact.size(), 1);
  CHECK_EQ(compact[0].clauses().size(), 2);

  // Quoted strings go on across lines.
  auto const multi{Rules::parse(
      "accept all with message \"one\ntwo\"\nreject all\n", "t")};
  CHECK_EQ(multi.size(), 2);
  CHECK_EQ(multi[0].clauses()[0].withs.at("message"), "one\ntwo");
  CHECK_EQ(multi[1].str(), "reject all");

  fails("reject", "empty expression");
  fails("frobnicate all", "unknown action 'frobnicate'");
  fails("\"reject\" all", "expected an action");
  fails("@sometime reject all", "unknown phase '@sometime'");
  fails("reject bogus x", "unknown operator 'bogus'");
  fails("reject from", "missing argument to 'from'");
  fails("reject from or", "missing argument to 'from'");
  fails("reject from joe", "bad address pattern");
  fails("reject helo a@b", "bad host name pattern");
  fails("reject source a@b", "bad host name pattern");
  fails("reject ip 10.0.0.0/33", "bad IP address pattern");
  fails("reject ip nonsense", "bad IP address pattern");
  fails("reject tls maybe", "tls must be on or off");
  fails("reject dnsbl a/b", "bad blocklist domain");
  fails("reject dbl host a@b", "bad blocklist domain");
  fails("reject dnsbl a..b", "bad blocklist domain");
  fails("reject dnsbl .zen.example", "bad blocklist domain");
  fails("reject dnsbl .", "bad blocklist domain");
  fails("reject dbl helo dbl..example", "bad blocklist domain");
  fails("reject dbl nodns x.y", "unknown option 'nodns'");
  fails("reject from-has bad,,route", "empty option");
  fails("reject from-has nodots", "unknown option 'nodots'");
  fails("reject helo-has", "missing argument to 'helo-has'");
  fails("reject ( from a@b.c", "missing ')'");
  fails("reject from a@b.c )", "unexpected ')'");
  fails("reject \"from\" a@b.c", "can't be an operator");
  fails("reject all or", "missing term after 'or'");
  fails("reject all;", "nothing after ';'");
  fails("reject all;\n", "nothing after ';'");
  fails("@from reject to a@b.c", "@from is too early");
  fails("@connect reject helo-has none", "@connect is too early");
  fails("set-with all", "set-with needs a with");
  fails("set-with from a@b.c; all", "set-with needs a with");
  fails("reject all with", "nothing after 'with'");
  fails("reject all with color red", "unknown with option 'color'");
  fails("reject all with message", "missing value for 'message'");
  fails("reject all with message \"\"", "empty value for 'message'");
  fails("reject all with tls-opt on", "tls-opt must be off or no-client");
  fails("reject all with note \"a\nb\"", "newline");
  fails("reject from \"a@b.c", "t:1: unterminated quoted string");
  fails("accept all\nreject from \"a@b.c\n\n", "t:2: unterminated quoted string");
  fails("include", "include takes one file name");
  fails("include a b", "include takes one file name");
  fails("accept all\n\nreject bogus\n", "t:3: unknown operator 'bogus'");

  // Includes.
  auto const dir{fs::temp_directory_path()
                 / ("Rules-parse-test." + std::to_string(getpid()))};
  fs::create_directories(dir);

  auto const a{dir / "a.rules"};
  auto const b{dir / "b.rules"};
  auto const c{dir / "c.rules"};
  auto const d{dir / "d.rules"};
  auto const empty{dir / "empty.rules"};

  write_file(a, ("include " + b.string() + "\naccept all\n").c_str());
  write_file(b, "# included\nreject from a@b.c\n");
  write_file(c, ("include " + c.string() + "\n").c_str());
  write_file(d, ("include \"" + (dir / "missing.rules").string() + "\"\n")
                    .c_str());
  write_file(empty, "");

  auto const included{Rules::parse_file(a.string())};
  CHECK_EQ(included.size(), 2);
  CHECK_EQ(included[0].str(), "reject from a@b.c");
  CHECK_EQ(included[1].str(), "accept all");

  // The same file twice, one after the other, is not a loop.
  auto const twice{Rules::parse(
      ("include " + b.string() + "\ninclude " + b.string()).c_str(), "t")};
  CHECK_EQ(twice.size(), 2);

  CHECK(Rules::parse_file(empty.string()).empty());

  for (auto const& [path, why] :
       {std::pair{c, "include loop"}, std::pair{d, "can't open rules file"},
        std::pair{dir / "nope.rules", "can't open rules file"}}) {
    try {
      Rules::parse_file(path.string());
      LOG(FATAL) << "no error from " << path;
    }
    catch (Rules::parse_error const& e) {
      CHECK(std::string_view{e.what()}.find(why) != std::string_view::npos)
          << e.what();
    }
  }

  fs::remove_all(dir);
}
