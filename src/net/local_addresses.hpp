#pragma once

#include <boost/asio/ip/address.hpp>
#include <functional>
#include <vector>

namespace agora::net {

// Source of host candidate addresses; tests inject their own
using AddressProvider = std::function<std::vector<boost::asio::ip::address>()>;

// Up, running, non-loopback, non-link-local IPv4 interface addresses in
// interface order. Empty on failure.
std::vector<boost::asio::ip::address> enumerate_local_addresses();

// Sorted copy, used as a cache key for the NAT assessment
std::vector<boost::asio::ip::address> sorted_addresses(std::vector<boost::asio::ip::address> addrs);

} // namespace agora::net
