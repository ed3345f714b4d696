#include "Rules-option.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include <boost/algorithm/string/join.hpp>

namespace Rules {

namespace {
struct option_name {
  std::string_view name;
  Option           opt;
};

// clang-format off
constexpr option_name address_names[]{
  {"unqualified", Option::unqualified},
  {"route",       Option::route},
  {"quoted",      Option::quoted},
  {"noat",        Option::noat},
  {"garbage",     Option::garbage},
  {"bad",         Option::bad},
  {"resolves",    Option::domain_valid},
  {"baddom",      Option::domain_invalid},
  {"unknown",     Option::domain_tempfail},
};

constexpr option_name helo_names[]{
  {"helo",     Option::helo},
  {"ehlo",     Option::ehlo},
  {"none",     Option::none},
  {"nodots",   Option::nodots},
  {"bareip",   Option::bareip},
  {"properip", Option::properip},
  {"ip",       Option::ip},
  {"myip",     Option::myip},
  {"remoteip", Option::remoteip},
  {"otherip",  Option::otherip},
  {"bogus",    Option::bogus},
};

constexpr option_name dns_names[]{
  {"nodns",        Option::nodns},
  {"inconsistent", Option::inconsistent},
  {"noforward",    Option::noforward},
  {"exists",       Option::exists},
  {"good",         Option::good},
};

// helo and ehlo are the same source, the HELO name.
constexpr option_name dbl_names[]{
  {"helo", Option::ehlo},
  {"ehlo", Option::ehlo},
  {"host", Option::host},
  {"from", Option::from},
  {"any",  Option::any},
};
// clang-format on

std::span<option_name const> names_of(option_kind kind)
{
  switch (kind) {
  case option_kind::address: return address_names;
  case option_kind::helo: return helo_names;
  case option_kind::dns: return dns_names;
  case option_kind::dbl: return dbl_names;
  }
  return {};
}

constexpr bool is_group(Option opt)
{
  auto const bits{static_cast<uint64_t>(opt)};
  return (bits & (bits - 1)) != 0;
}
} // namespace

std::optional<Option> find_option(option_kind kind, std::string_view name)
{
  for (auto const& n : names_of(kind)) {
    if (n.name == name)
      return n.opt;
  }
  return {};
}

std::string option_str(option_kind kind, Option opts)
{
  auto const names{names_of(kind)};

  std::vector<std::string> strs;

  for (auto const& n : names) {
    if (is_group(n.opt) && ((opts & n.opt) == n.opt)) {
      strs.emplace_back(n.name);
      opts = opts & ~n.opt;
    }
  }
  for (auto const& n : names) {
    if (!is_group(n.opt) && test(opts, n.opt)) {
      strs.emplace_back(n.name);
      opts = opts & ~n.opt;
    }
  }

  std::sort(begin(strs), end(strs));
  return boost::algorithm::join(strs, ",");
}

std::ostream& operator<<(std::ostream& os, Option opts)
{
  if (opts == Option::zero)
    return os << "zero";

  std::vector<std::string> strs;
  for (auto kind : {option_kind::helo, option_kind::dns, option_kind::address,
                    option_kind::dbl}) {
    for (auto const& n : names_of(kind)) {
      if (!is_group(n.opt) && test(opts, n.opt)) {
        strs.emplace_back(n.name);
        opts = opts & ~n.opt;
      }
    }
  }
  return os << boost::algorithm::join(strs, "|");
}

} // namespace Rules
