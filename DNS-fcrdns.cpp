#include "DNS-fcrdns.hpp"

#include "IP.hpp"
#include "IP4.hpp"
#include "IP6.hpp"

#include <algorithm>

#include <glog/logging.h>

// <https://en.wikipedia.org/wiki/Forward-confirmed_reverse_DNS>

namespace DNS {

namespace {
void sort_names(std::vector<std::string>& names)
{
  // Sort 1st by name length: short to long.
  std::sort(begin(names), end(names),
            [](std::string_view a, std::string_view b) {
              if (a.length() != b.length())
                return a.length() < b.length();
              return a < b;
            });

  names.erase(std::unique(begin(names), end(names)), end(names));
}

Rdns classify(Lookup& res, std::string_view addr, std::string const& reversed)
{
  Rdns rdns;

  // The reverse part, check PTR records.
  std::vector<std::string> ptrs;
  std::string              msg;
  if (res.ptr(reversed, ptrs, msg) != lookup_status::ok) {
    VLOG(1) << "no PTR for " << addr << ": " << msg;
  }

  for (auto const& ptr : ptrs) {
    // The forward part, check each PTR for a matching address.
    std::vector<std::string> addrs;
    if ((res.addresses(ptr, addrs, msg) != lookup_status::ok)
        || addrs.empty()) {
      rdns.nofwd.push_back(ptr);
      continue;
    }
    auto const match = std::find_if(begin(addrs), end(addrs),
                                    [addr](std::string_view a) {
                                      return IP::same_address(a, addr);
                                    });
    if (match != end(addrs))
      rdns.verified.push_back(ptr);
    else
      rdns.inconsistent.push_back(ptr);
  }

  sort_names(rdns.verified);
  sort_names(rdns.nofwd);
  sort_names(rdns.inconsistent);

  return rdns;
}
} // namespace

Rdns fcrdns4(Lookup& res, std::string_view addr)
{
  return classify(res, addr, IP4::reverse(addr) + "in-addr.arpa");
}

Rdns fcrdns6(Lookup& res, std::string_view addr)
{
  return classify(res, addr, IP6::reverse(addr) + "ip6.arpa");
}

Rdns fcrdns(Lookup& res, std::string_view addr)
{
  if (IP4::is_address(addr))
    return fcrdns4(res, addr);
  if (IP6::is_address(addr))
    return fcrdns6(res, addr);
  LOG(FATAL) << "not a valid IP address " << addr;
}
} // namespace DNS
