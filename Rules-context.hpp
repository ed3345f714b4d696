#ifndef RULES_CONTEXT_DOT_HPP
#define RULES_CONTEXT_DOT_HPP

#include "DNS-fcrdns.hpp"
#include "DNS-lookup.hpp"
#include "DNS-valid.hpp"
#include "Patterns.hpp"
#include "Rules-option.hpp"

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Rules {

// Everything known about one connection, filled in as the SMTP
// conversation goes along.  Belongs to that connection alone.

class Context {
public:
  Context(DNS::Lookup& dns, Patterns& patterns);

  Context(Context const&) = delete;
  Context& operator=(Context const&) = delete;

  std::string remote_ip;
  std::string local_ip;
  DNS::Rdns   rdns;
  bool        tls_on{false};

  std::string helo_name;
  bool        ehlo{false}; // EHLO rather than HELO

  std::string from;
  std::string rcpt_to; // the one under test

  // Merged from every matching clause, set-with or not.
  std::map<std::string, std::string> with_props;

  // Some matcher had no patterns to match against.  Reset as each
  // Rule is checked.
  bool rule_miss{false};

  // DNSBL and DBL domains that listed us, in order, once each.
  std::vector<std::string> dnsbl_hits;

  void add_dnsbl_hit(std::string_view domain);

  std::vector<std::string> const& patterns(std::string const& arg);

  // Blocklist lookup, cached.
  bool is_listed(std::string const& name);

  // Cached per domain for the life of the connection.
  DNS::validity domain_validity(std::string_view domain);

  // address_shape() plus domain validity for plain addresses.
  Option address_options(std::string_view addr);
  Option helo_options() const;
  Option dns_options() const;

private:
  DNS::Lookup& dns_;
  Patterns&    patterns_;

  std::unordered_map<std::string, DNS::validity> validity_;
  std::unordered_map<std::string, bool>          listed_;
};

} // namespace Rules

#endif // RULES_CONTEXT_DOT_HPP
