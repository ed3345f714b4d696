#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "DNS-lookup.hpp"

// forward decl
typedef struct ldns_struct_rdf      ldns_rdf;
typedef struct ldns_struct_resolver ldns_resolver;

namespace DNS_ldns {

class Domain {
public:
  Domain(Domain const&) = delete;
  Domain& operator=(Domain const&) = delete;

  explicit Domain(std::string const& domain);
  ~Domain();

  std::string const& str() const { return str_; }
  ldns_rdf*          get() const { return rdfp_; }

  // Null get() when ldns won't take the name, and why.
  std::string const& error() const { return error_; }

private:
  std::string str_;
  std::string error_;
  ldns_rdf*   rdfp_{nullptr};

  friend std::ostream& operator<<(std::ostream& os, Domain const& dom)
  {
    return os << dom.str();
  }
};

class Resolver : public DNS::Lookup {
public:
  Resolver(Resolver const&) = delete;
  Resolver& operator=(Resolver const&) = delete;

  Resolver();
  ~Resolver() override;

  DNS::lookup_status mx(std::string const&    domain,
                        std::vector<DNS::MX>& mxs,
                        std::string&          msg) override;

  DNS::lookup_status addresses(std::string const&        host,
                               std::vector<std::string>& addrs,
                               std::string&              msg) override;

  DNS::lookup_status ptr(std::string const&        name,
                         std::vector<std::string>& names,
                         std::string&              msg) override;

  bool listed(std::string const& name) override;

  ldns_resolver* get() const { return res_; }

private:
  ldns_resolver* res_;
};

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP
