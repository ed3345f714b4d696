#include "DNS-valid.hpp"

#include "IP.hpp"
#include "iequal.hpp"

#include <vector>

#include <glog/logging.h>

#include <fmt/format.h>

namespace DNS {

bool is_domain_name(std::string_view name)
{
  if (!name.empty() && (name.back() == '.'))
    name.remove_suffix(1);

  if (name.empty() || (name.size() > 253))
    return false;

  for (;;) {
    auto const dot{name.find('.')};
    auto const label{name.substr(0, dot)};
    if (label.empty() || (label.size() > 63))
      return false;
    if (dot == std::string_view::npos)
      return true;
    name.remove_prefix(dot + 1);
  }
}

validity check_ip(Lookup& res, std::string const& host, std::string& msg)
{
  std::vector<std::string> addrs;

  switch (res.addresses(host, addrs, msg)) {
  case lookup_status::transient: return validity::tempfail;
  case lookup_status::permanent: return validity::bad;
  case lookup_status::ok: break;
  }

  if (addrs.empty()) {
    msg = fmt::format("{} has no addresses", host);
    return validity::bad;
  }

  for (auto const& addr : addrs) {
    if (!IP::is_global_unicast(addr)) {
      msg = fmt::format("{} has non-global address {}", host, addr);
      return validity::bad;
    }
    if (IP::is_private(addr)) {
      msg = fmt::format("{} has private address {}", host, addr);
      return validity::bad;
    }
  }

  msg.clear();
  return validity::good;
}

validity valid_domain(Lookup& res, std::string_view domain, std::string& msg)
{
  if (!is_domain_name(domain)) {
    msg = fmt::format("\"{}\" is not a domain name", domain);
    return validity::bad;
  }
  if (domain.back() == '.')
    domain.remove_suffix(1);

  auto const fqdn{fmt::format("{}.", domain)};

  std::vector<MX> mxs;

  switch (res.mx(fqdn, mxs, msg)) {
  case lookup_status::transient: return validity::tempfail;
  case lookup_status::permanent: return check_ip(res, fqdn, msg);
  case lookup_status::ok: break;
  }

  if (mxs.empty())
    return check_ip(res, fqdn, msg);

  auto best{validity::undefined};

  for (auto const& mx : mxs) {
    // RFC 7505 null MX.
    if ((mx.exchange == ".") && (mx.preference == 0)) {
      msg = fmt::format("{} has a null MX", domain);
      return validity::bad;
    }
    if (iequal(mx.exchange, ".") || iequal(mx.exchange, "localhost.")) {
      msg = fmt::format("{} has an MX to {}", domain, mx.exchange);
      return validity::bad;
    }

    std::string mx_msg;
    auto const v{check_ip(res, mx.exchange, mx_msg)};
    if (v > best) {
      best = v;
      msg  = mx_msg;
    }
  }

  VLOG(1) << "domain " << domain << " is " << validity_c_str(best);

  return best;
}

} // namespace DNS
