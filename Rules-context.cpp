#include "Rules-context.hpp"

#include "Rules-attrs.hpp"
#include "iequal.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace Rules {

Context::Context(DNS::Lookup& dns, Patterns& patterns)
  : dns_(dns)
  , patterns_(patterns)
{
}

void Context::add_dnsbl_hit(std::string_view domain)
{
  if (std::find(begin(dnsbl_hits), end(dnsbl_hits), domain) == end(dnsbl_hits))
    dnsbl_hits.emplace_back(domain);
}

std::vector<std::string> const& Context::patterns(std::string const& arg)
{
  return patterns_.resolve(arg);
}

bool Context::is_listed(std::string const& name)
{
  auto const key{to_lower(name)};

  auto const it = listed_.find(key);
  if (it != end(listed_))
    return it->second;

  auto const listed{dns_.listed(key)};
  if (listed)
    LOG(INFO) << name << " is listed";

  return listed_.emplace(key, listed).first->second;
}

DNS::validity Context::domain_validity(std::string_view domain)
{
  auto const key{to_lower(domain)};

  auto const it = validity_.find(key);
  if (it != end(validity_))
    return it->second;

  std::string msg;
  auto const v{DNS::valid_domain(dns_, key, msg)};
  if (v != DNS::validity::good)
    LOG(INFO) << "domain " << key << " is " << DNS::validity_c_str(v) << ": "
              << msg;

  return validity_.emplace(key, v).first->second;
}

Option Context::address_options(std::string_view addr)
{
  std::string_view domain;

  auto opts{address_shape(addr, domain)};

  if (!addr.empty() && !test(opts, not_plain))
    opts |= validity_option(domain_validity(domain));

  return opts;
}

Option Context::helo_options() const
{
  return (ehlo ? Option::ehlo : Option::helo)
         | helo_shape(helo_name, local_ip, remote_ip);
}

Option Context::dns_options() const { return dns_shape(rdns); }

} // namespace Rules
