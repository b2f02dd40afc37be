#pragma once

#include "address.hh"
#include "file_descriptor.hh"

#include <cstdint>
#include <functional>
#include <string>
#include <sys/socket.h>

class Socket : public FileDescriptor
{
  Address get_address( const std::string& name_of_function,
                       const std::function<int( int, sockaddr*, socklen_t* )>& function ) const;

protected:
  Socket( const int domain, const int type );
  Socket( FileDescriptor&& fd, const int domain, const int type );

  template<typename option_type>
  void setsockopt( const int level, const int option, const option_type& option_value );

  template<typename option_type>
  void getsockopt( const int level, const int option, option_type& option_value ) const;

public:
  void bind( const Address& address );
  /* on a non-blocking socket, returns with the connect in progress; check throw_if_error() once writable */
  void connect( const Address& address );
  void shutdown( const int how );

  Address local_address() const;
  Address peer_address() const;

  void set_reuseaddr();
  void set_receive_timeout_ms( const unsigned int timeout_ms );

  /* raises the pending SO_ERROR, if any */
  void throw_if_error() const;
};

struct received_datagram
{
  Address source_address;
  std::string payload;
};

class UDPSocket : public Socket
{
public:
  UDPSocket()
    : Socket( AF_INET, SOCK_DGRAM )
  {}

  /* false on timeout (SO_RCVTIMEO) or when a non-blocking socket has nothing */
  bool recv( received_datagram& datagram );
  received_datagram recv();

  void sendto( const Address& destination, const std::string_view payload );
  void sendto_ignore_errors( const Address& destination, const std::string_view payload );

  void join_multicast_group( const Address& group );
  void leave_multicast_group( const Address& group );
  void set_multicast_loopback( const bool enabled );
  void set_multicast_ttl( const uint8_t ttl );
};

class TCPSocket : public Socket
{
  explicit TCPSocket( FileDescriptor&& fd )
    : Socket( std::move( fd ), AF_INET, SOCK_STREAM )
  {}

public:
  TCPSocket()
    : Socket( AF_INET, SOCK_STREAM )
  {}

  void listen( const int backlog = 16 );
  TCPSocket accept();
  void set_nodelay();
};
