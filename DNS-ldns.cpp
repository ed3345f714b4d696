#include "DNS-ldns.hpp"

#include <cstdbool> // needs to be above ldns includes
#include <ldns/ldns.h>
#include <ldns/packet.h>
#include <ldns/rr.h>

#include <arpa/inet.h>
#include <sys/time.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <fmt/format.h>

// The default timeout in glibc is 5 seconds.  A validating resolver
// in front of us can take a little longer.
DEFINE_int32(dns_timeout, 7, "seconds to wait for each DNS query");
DEFINE_int32(dns_retries, 2, "number of times to retry a DNS query");

namespace DNS_ldns {

std::string rr_name_str(ldns_rdf const* rdf)
{
  auto const sz = ldns_rdf_size(rdf);

  if (sz > LDNS_MAX_DOMAINLEN) {
    LOG(WARNING) << "rdf size too large";
    return "<too long>";
  }
  if (sz == 1) {
    return ""; // root label
  }

  auto const data = ldns_rdf_data(rdf);

  unsigned char src_pos = 0;
  unsigned char len = data[src_pos];

  std::string str;
  str.reserve(64);
  while ((len > 0) && (src_pos < sz)) {
    src_pos++;
    for (unsigned char i = 0; i < len; ++i) {
      unsigned char c = data[src_pos];
      if (c == '.' || c == '\\') {
        str += '\\';
      }
      str += c;
      src_pos++;
    }
    if (src_pos < sz) {
      str += '.';
    }
    len = data[src_pos];
  }

  if (str.length() && ('.' == str.back())) {
    str.erase(str.length() - 1);
  }

  return str;
}

std::string rr_addr_str(int af, ldns_rdf const* rdf)
{
  char str[INET6_ADDRSTRLEN];
  PCHECK(inet_ntop(af, ldns_rdf_data(rdf), str, sizeof str));
  return str;
}

Domain::Domain(std::string const& domain)
  : str_(domain)
{
  auto const status = ldns_str2rdf_dname(&rdfp_, domain.c_str());
  if (status != LDNS_STATUS_OK) {
    rdfp_  = nullptr;
    error_ = ldns_get_errorstr_by_id(status);
  }
}

Domain::~Domain()
{
  if (rdfp_)
    ldns_rdf_deep_free(rdfp_);
}

namespace {
class Query {
public:
  Query(Query const&) = delete;
  Query& operator=(Query const&) = delete;

  Query(Resolver const& res, ldns_rr_type type, std::string const& domain);
  ~Query();

  bool bogus_or_indeterminate() const { return bogus_or_indeterminate_; }
  bool nx_domain() const { return nx_domain_; }

  std::string const& msg() const { return msg_; }

  DNS::lookup_status status() const
  {
    if (bogus_or_indeterminate_)
      return DNS::lookup_status::transient;
    if (nx_domain_)
      return DNS::lookup_status::permanent;
    return DNS::lookup_status::ok;
  }

  // Answer section records of our type, skipping any CNAMEs.
  template <typename Fn>
  void for_each(Fn fn) const
  {
    if (!p_)
      return;
    auto const answer = ldns_pkt_answer(p_); // not a clone, no free
    if (!answer)
      return;
    for (unsigned i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
      auto const rr = ldns_rr_list_rr(answer, i);
      if (rr && (ldns_rr_get_type(rr) == type_))
        fn(rr);
    }
  }

private:
  ldns_pkt*    p_{nullptr};
  ldns_rr_type type_;
  std::string  msg_;

  bool bogus_or_indeterminate_{false};
  bool nx_domain_{false};
};

Query::Query(Resolver const& res, ldns_rr_type type, std::string const& domain)
  : type_(type)
{
  Domain dom(domain);

  // Nothing to ask about.
  if (!dom.get()) {
    nx_domain_ = true;
    msg_       = fmt::format("bad domain name {}: {}", dom.str(), dom.error());
    LOG(WARNING) << msg_;
    return;
  }

  ldns_status status
      = ldns_resolver_query_status(&p_, res.get(), dom.get(), type,
                                   LDNS_RR_CLASS_IN, LDNS_RD | LDNS_AD);

  if (status != LDNS_STATUS_OK) {
    bogus_or_indeterminate_ = true;
    msg_ = fmt::format("lookup of {} failed: {}", dom.str(),
                       ldns_get_errorstr_by_id(status));

    // If we have only one nameserver, reset the RTT otherwise all
    // future use of this resolver object will fail.

    ldns_resolver_set_nameserver_rtt(res.get(), 0,
                                     LDNS_RESOLV_RTT_MIN); // "reachable"
  }

  if (p_) {
    auto const rcode = ldns_pkt_get_rcode(p_);

    switch (rcode) {
    case LDNS_RCODE_NOERROR:
      break;

    case LDNS_RCODE_NXDOMAIN:
      nx_domain_ = true;
      msg_ = fmt::format("no such domain {}", dom.str());
      break;

    case LDNS_RCODE_SERVFAIL:
      bogus_or_indeterminate_ = true;
      msg_ = fmt::format("server failure looking up {}", dom.str());
      break;

    default:
      bogus_or_indeterminate_ = true;
      msg_ = fmt::format("lookup of {} failed, rcode {}", dom.str(),
                         static_cast<int>(rcode));
      LOG(WARNING) << "DNS unknown error (" << dom.str() << "/" << type
                   << "), rcode = " << rcode;
      break;
    }
  }
}

Query::~Query()
{
  if (p_)
    ldns_pkt_free(p_);
}

void add_addresses(Query const&              q,
                   int                       af,
                   std::vector<std::string>& addrs)
{
  q.for_each([af, &addrs](ldns_rr const* rr) {
    CHECK_EQ(ldns_rr_rd_count(rr), 1);
    addrs.push_back(rr_addr_str(af, ldns_rr_rdf(rr, 0)));
  });
}
} // namespace

Resolver::Resolver()
{
  auto status = ldns_resolver_new_frm_file(&res_, nullptr);
  CHECK_EQ(status, LDNS_STATUS_OK) << "failed to initialize DNS resolver: "
                                   << ldns_get_errorstr_by_id(status);

  timeval tv{};
  tv.tv_sec = FLAGS_dns_timeout;
  ldns_resolver_set_timeout(res_, tv);
  ldns_resolver_set_retry(res_, static_cast<uint8_t>(FLAGS_dns_retries));
}

Resolver::~Resolver() { ldns_resolver_deep_free(res_); }

DNS::lookup_status Resolver::mx(std::string const&    domain,
                                std::vector<DNS::MX>& mxs,
                                std::string&          msg)
{
  Query q(*this, LDNS_RR_TYPE_MX, domain);

  q.for_each([&mxs](ldns_rr const* rr) {
    CHECK_EQ(ldns_rr_rd_count(rr), 2);
    auto const rdf_0 = ldns_rr_rdf(rr, 0);
    CHECK_EQ(ldns_rdf_get_type(rdf_0), LDNS_RDF_TYPE_INT16);
    auto const rdf_1 = ldns_rr_rdf(rr, 1);
    CHECK_EQ(ldns_rdf_get_type(rdf_1), LDNS_RDF_TYPE_DNAME);
    auto const name = rr_name_str(rdf_1);
    mxs.push_back(
        DNS::MX{name.empty() ? "." : name + ".", ldns_rdf2native_int16(rdf_0)});
  });

  msg = q.msg();

  if ((q.status() == DNS::lookup_status::ok) && mxs.empty()) {
    msg = fmt::format("no MX records for {}", domain);
    return DNS::lookup_status::permanent;
  }
  return q.status();
}

DNS::lookup_status Resolver::addresses(std::string const&        host,
                                       std::vector<std::string>& addrs,
                                       std::string&              msg)
{
  Query q4(*this, LDNS_RR_TYPE_A, host);
  add_addresses(q4, AF_INET, addrs);

  Query q6(*this, LDNS_RR_TYPE_AAAA, host);
  add_addresses(q6, AF_INET6, addrs);

  if (!addrs.empty())
    return DNS::lookup_status::ok;

  if (q4.status() == DNS::lookup_status::transient) {
    msg = q4.msg();
    return DNS::lookup_status::transient;
  }
  if (q6.status() == DNS::lookup_status::transient) {
    msg = q6.msg();
    return DNS::lookup_status::transient;
  }

  msg = q4.msg().empty() ? fmt::format("no addresses for {}", host) : q4.msg();
  return DNS::lookup_status::permanent;
}

DNS::lookup_status Resolver::ptr(std::string const&        name,
                                 std::vector<std::string>& names,
                                 std::string&              msg)
{
  Query q(*this, LDNS_RR_TYPE_PTR, name);

  q.for_each([&names](ldns_rr const* rr) {
    CHECK_EQ(ldns_rr_rd_count(rr), 1);
    auto const rdf = ldns_rr_rdf(rr, 0);
    CHECK_EQ(ldns_rdf_get_type(rdf), LDNS_RDF_TYPE_DNAME);
    names.push_back(rr_name_str(rdf));
  });

  msg = q.msg();
  return q.status();
}

bool Resolver::listed(std::string const& name)
{
  Query q(*this, LDNS_RR_TYPE_A, name);

  auto found{false};
  q.for_each([&found](ldns_rr const*) { found = true; });
  return found;
}

} // namespace DNS_ldns
