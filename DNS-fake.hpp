#ifndef DNS_FAKE_DOT_HPP
#define DNS_FAKE_DOT_HPP

// Canned answers, for tests.

#include "DNS-lookup.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace DNS {

class Fake : public Lookup {
public:
  template <typename T>
  struct answer {
    lookup_status  status{lookup_status::ok};
    std::vector<T> records;
  };

  std::map<std::string, answer<MX>>          mx_answers;
  std::map<std::string, answer<std::string>> address_answers;
  std::map<std::string, answer<std::string>> ptr_answers;
  std::set<std::string>                      listed_names;

  int queries{0};
  int listed_queries{0};

  lookup_status
  mx(std::string const& domain, std::vector<MX>& mxs, std::string& msg) override
  {
    return find(mx_answers, domain, mxs, msg);
  }

  lookup_status addresses(std::string const&        host,
                          std::vector<std::string>& addrs,
                          std::string&              msg) override
  {
    return find(address_answers, host, addrs, msg);
  }

  lookup_status ptr(std::string const&        name,
                    std::vector<std::string>& names,
                    std::string&              msg) override
  {
    return find(ptr_answers, name, names, msg);
  }

  bool listed(std::string const& name) override
  {
    ++listed_queries;
    return listed_names.count(name) != 0;
  }

private:
  template <typename T>
  lookup_status find(std::map<std::string, answer<T>> const& answers,
                     std::string const&                      name,
                     std::vector<T>&                         records,
                     std::string&                            msg)
  {
    ++queries;
    auto const it = answers.find(name);
    if (it == end(answers)) {
      msg = "no such domain " + name;
      return lookup_status::permanent;
    }
    if (it->second.status != lookup_status::ok)
      msg = std::string{"lookup of "} + name + " failed, "
            + lookup_status_c_str(it->second.status);
    records.insert(end(records), begin(it->second.records),
                   end(it->second.records));
    return it->second.status;
  }
};

} // namespace DNS

#endif // DNS_FAKE_DOT_HPP
