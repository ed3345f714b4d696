#include "Rules-match.hpp"

#include "IP.hpp"
#include "iequal.hpp"

#include <string>

#include <glog/logging.h>

namespace Rules {

namespace {
// Drop the root, but leave "." itself alone.
std::string_view unroot(std::string_view name)
{
  if ((name.size() > 1) && (name.back() == '.'))
    name.remove_suffix(1);
  return name;
}
} // namespace

bool match_address(std::string_view addr_in, std::string_view pattern_in)
{
  auto const addr{to_lower(addr_in)};
  auto const pat{to_lower(pattern_in)};

  if (pat == "<>")
    return addr.empty();

  if (pat.empty() || addr.empty() || (addr.front() == '@')
      || (addr.back() == '@'))
    return false;

  auto const a{std::string_view{addr}};
  auto const p{std::string_view{pat}};

  auto const at{a.rfind('@')};
  auto const local{a.substr(0, at)};
  auto const domain{(at == std::string_view::npos) ? std::string_view{}
                                                   : a.substr(at + 1)};

  if (p == "@")
    return at != std::string_view::npos;

  if (p.back() == '@')
    return local == p.substr(0, p.size() - 1);

  if (p.front() == '@') {
    if (at == std::string_view::npos)
      return false;
    auto const pdom{p.substr(1)};
    if (pdom.front() == '.')
      return (domain == pdom.substr(1)) || iends_with(domain, pdom);
    return domain == pdom;
  }

  return a == p;
}

bool match_host(std::string_view host_in, std::string_view pattern_in)
{
  auto const host_str{to_lower(host_in)};
  auto const pat_str{to_lower(pattern_in)};

  auto const host{unroot(host_str)};
  auto const pat{unroot(pat_str)};

  if (pat.empty())
    return false;

  if (pat.front() == '.')
    return (host == pat.substr(1)) || iends_with(host, pat);

  return host == pat;
}

bool match_ip(std::string_view addr, std::string_view pattern)
{
  if (!IP::is_network(pattern)) {
    LOG_FIRST_N(WARNING, 10) << "ignoring bad IP pattern " << pattern;
    return false;
  }
  return IP::in_network(addr, pattern);
}

bool match_from_host(std::string_view addr, std::string_view host_pattern)
{
  return match_address(addr, std::string{"@"} + std::string{host_pattern});
}

} // namespace Rules
