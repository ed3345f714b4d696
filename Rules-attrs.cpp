#include "Rules-attrs.hpp"

#include "IP.hpp"
#include "IP6.hpp"

namespace Rules {

namespace {
// Index of the '"' closing a quoted local part that opens at 0.
std::string_view::size_type closing_quote(std::string_view addr)
{
  for (auto i{1u}; i < addr.size(); ++i) {
    if (addr[i] == '\\')
      ++i;
    else if (addr[i] == '"')
      return i;
  }
  return std::string_view::npos;
}
} // namespace

Option address_shape(std::string_view addr, std::string_view& domain)
{
  domain = std::string_view{};

  if (addr.empty())
    return Option::zero;

  auto const last_at{addr.rfind('@')};
  if (last_at == std::string_view::npos)
    return Option::noat;

  auto opts{Option::zero};

  if (addr.find_first_of("<>") != std::string_view::npos)
    opts |= Option::garbage;

  std::string_view local;
  std::string_view dom;

  if (addr.front() == '@') {
    // @route:user@domain
    auto const colon{addr.find(':')};
    if ((colon != std::string_view::npos)
        && (addr.find('@', colon) != std::string_view::npos)) {
      opts |= Option::route;
      local = addr.substr(colon + 1, last_at - colon - 1);
    }
    else {
      opts |= Option::garbage;
    }
    dom = addr.substr(last_at + 1);
  }
  else if (addr.front() == '"') {
    opts |= Option::quoted;
    auto const close{closing_quote(addr)};
    if (close == std::string_view::npos) {
      opts |= Option::garbage;
      local = addr.substr(0, last_at);
      dom   = addr.substr(last_at + 1);
    }
    else {
      local = addr.substr(0, close + 1);
      auto const rest{addr.substr(close + 1)};
      if (rest.empty() || (rest.front() != '@')) {
        opts |= Option::garbage;
        auto const at{rest.rfind('@')};
        dom = (at == std::string_view::npos) ? std::string_view{}
                                             : rest.substr(at + 1);
      }
      else {
        dom = rest.substr(1);
      }
    }
  }
  else {
    auto const at{addr.find('@')};
    local = addr.substr(0, at);
    dom   = addr.substr(at + 1);
    if (local.find('"') != std::string_view::npos)
      opts |= Option::garbage;
  }

  if (local.empty() && !test(opts, Option::route))
    opts |= Option::garbage;

  // Quoting doesn't make this any better.
  if (local.find("..") != std::string_view::npos)
    opts |= Option::garbage;

  if (dom.find_first_of("@\"") != std::string_view::npos)
    opts |= Option::garbage;

  // Whatever comes after the last '@' is the domain, for better or
  // for worse.
  auto const at{dom.rfind('@')};
  if (at != std::string_view::npos)
    dom = dom.substr(at + 1);

  if (dom.empty())
    opts |= Option::garbage | Option::unqualified;
  else if (dom.find('.') == std::string_view::npos)
    opts |= Option::unqualified;

  domain = dom;
  return opts;
}

Option validity_option(DNS::validity v)
{
  switch (v) {
  case DNS::validity::good: return Option::domain_valid;
  case DNS::validity::bad: return Option::domain_invalid;
  case DNS::validity::tempfail: return Option::domain_tempfail;
  case DNS::validity::undefined: break;
  }
  return Option::zero;
}

Option helo_shape(std::string_view helo,
                  std::string_view local_ip,
                  std::string_view remote_ip)
{
  if (helo.empty())
    return Option::none | Option::nodots;

  if (helo == ".")
    return Option::bogus | Option::nodots;

  auto const which_ip = [=](std::string_view addr) {
    if (IP::same_address(addr, local_ip))
      return Option::myip;
    if (IP::same_address(addr, remote_ip))
      return Option::remoteip;
    return Option::otherip;
  };

  if (IP::is_address(helo))
    return Option::bareip | which_ip(helo);

  // RFC 5321 address literal, "[IPv6:...]" for IPv6.
  if (IP::is_address_literal(helo))
    return Option::properip | which_ip(IP::as_address(helo));

  // Lots of clients leave the tag off.
  if ((helo.size() > 2) && (helo.front() == '[') && (helo.back() == ']')) {
    auto const addr{helo.substr(1, helo.size() - 2)};
    if (IP6::is_address(addr))
      return Option::properip | which_ip(addr);
  }

  // A ':' is as good as a dot.
  if (helo.find_first_of(".:") == std::string_view::npos)
    return Option::nodots;

  return Option::zero;
}

Option dns_shape(DNS::Rdns const& rdns)
{
  auto opts{rdns.verified.empty() ? Option::nodns : Option::exists};

  if (!rdns.nofwd.empty())
    opts |= Option::noforward;
  if (!rdns.inconsistent.empty())
    opts |= Option::inconsistent;

  if (!rdns.verified.empty() && rdns.nofwd.empty()
      && rdns.inconsistent.empty())
    opts |= Option::good;

  return opts;
}

} // namespace Rules
