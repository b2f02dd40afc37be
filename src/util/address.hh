#pragma once

#include <cstdint>
#include <netdb.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <utility>

class Address
{
  class Raw
  {
  public:
    sockaddr_storage storage {};
    operator sockaddr*();
    operator const sockaddr*() const;
  };

  socklen_t size_;
  Raw address_ {};

  Address( const std::string& node, const std::string& service, const addrinfo& hints );

public:
  /* name resolution (DNS lookup of hostname, service name or number) */
  Address( const std::string& hostname, const std::string& service );

  /* numeric dotted-quad IPv4 address and port */
  Address( const std::string& ip, const uint16_t port );

  Address( const sockaddr* addr, const std::size_t size );

  std::pair<std::string, uint16_t> ip_port() const;
  std::string ip() const { return ip_port().first; }
  uint16_t port() const { return ip_port().second; }
  std::string to_string() const;

  /* IPv4 address as a host-order integer */
  uint32_t ipv4_numeric() const;
  static Address from_ipv4_numeric( const uint32_t ip_address, const uint16_t port = 0 );

  bool is_multicast() const;

  socklen_t size() const { return size_; }
  const sockaddr* raw() const { return static_cast<const sockaddr*>( address_ ); }

  bool operator==( const Address& other ) const;
  bool operator!=( const Address& other ) const { return not operator==( other ); }
  bool operator<( const Address& other ) const;
};
