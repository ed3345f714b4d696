#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include <string_view>

namespace IP {
bool is_private(std::string_view addr);
bool is_global_unicast(std::string_view addr);
bool is_address(std::string_view addr);
bool is_address_literal(std::string_view addr);
std::string_view as_address(std::string_view addr);

// Same address, independent of how it's written: "::1" and "0::1".
bool same_address(std::string_view a, std::string_view b);

// A network is an address with an optional "/prefix-length".
bool is_network(std::string_view net);
bool in_network(std::string_view addr, std::string_view net);
} // namespace IP

#endif // IP_DOT_HPP
