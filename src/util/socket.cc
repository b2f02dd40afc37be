#include "socket.hh"
#include "exception.hh"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <netinet/tcp.h>
#include <stdexcept>
#include <sys/time.h>

using namespace std;

Socket::Socket( FileDescriptor&& fd, const int domain, const int type )
  : FileDescriptor( move( fd ) )
{
  int actual_value;
  socklen_t len;

  len = sizeof( actual_value );
  CheckSystemCall( "getsockopt", ::getsockopt( fd_num(), SOL_SOCKET, SO_DOMAIN, &actual_value, &len ) );
  if ( ( len != sizeof( actual_value ) ) or ( actual_value != domain ) ) {
    throw runtime_error( "socket domain mismatch" );
  }

  len = sizeof( actual_value );
  CheckSystemCall( "getsockopt", ::getsockopt( fd_num(), SOL_SOCKET, SO_TYPE, &actual_value, &len ) );
  if ( ( len != sizeof( actual_value ) ) or ( actual_value != type ) ) {
    throw runtime_error( "socket type mismatch" );
  }
}

Socket::Socket( const int domain, const int type )
  : FileDescriptor( CheckSystemCall( "socket", socket( domain, type | SOCK_CLOEXEC, 0 ) ) )
{}

Address Socket::get_address( const string& name_of_function,
                             const function<int( int, sockaddr*, socklen_t* )>& function ) const
{
  sockaddr_storage address {};
  socklen_t size = sizeof( address );

  CheckSystemCall( name_of_function, function( fd_num(), reinterpret_cast<sockaddr*>( &address ), &size ) );

  return { reinterpret_cast<sockaddr*>( &address ), size };
}

Address Socket::local_address() const
{
  return get_address( "getsockname", getsockname );
}

Address Socket::peer_address() const
{
  return get_address( "getpeername", getpeername );
}

void Socket::bind( const Address& address )
{
  CheckSystemCall( "bind", ::bind( fd_num(), address.raw(), address.size() ) );
}

void Socket::connect( const Address& address )
{
  if ( ::connect( fd_num(), address.raw(), address.size() ) < 0 ) {
    if ( non_blocking() and errno == EINPROGRESS ) {
      return;
    }
    throw unix_error { "connect" };
  }
}

void Socket::shutdown( const int how )
{
  CheckSystemCall( "shutdown", ::shutdown( fd_num(), how ) );
  switch ( how ) {
    case SHUT_RD:
      register_read();
      break;
    case SHUT_WR:
      register_write();
      break;
    case SHUT_RDWR:
      register_read();
      register_write();
      break;
    default:
      throw runtime_error( "Socket::shutdown() called with invalid `how`" );
  }
}

template<typename option_type>
void Socket::setsockopt( const int level, const int option, const option_type& option_value )
{
  CheckSystemCall( "setsockopt", ::setsockopt( fd_num(), level, option, &option_value, sizeof( option_value ) ) );
}

template<typename option_type>
void Socket::getsockopt( const int level, const int option, option_type& option_value ) const
{
  socklen_t optlen = sizeof( option_value );
  CheckSystemCall( "getsockopt", ::getsockopt( fd_num(), level, option, &option_value, &optlen ) );
  if ( optlen != sizeof( option_value ) ) {
    throw runtime_error( "unexpected length from getsockopt" );
  }
}

void Socket::set_reuseaddr()
{
  setsockopt( SOL_SOCKET, SO_REUSEADDR, int( true ) );
}

void Socket::set_receive_timeout_ms( const unsigned int timeout_ms )
{
  timeval tv {};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = ( timeout_ms % 1000 ) * 1000;
  setsockopt( SOL_SOCKET, SO_RCVTIMEO, tv );
}

void Socket::throw_if_error() const
{
  int socket_error = 0;
  getsockopt( SOL_SOCKET, SO_ERROR, socket_error );
  if ( socket_error ) {
    throw unix_error { "socket error", socket_error };
  }
}

bool UDPSocket::recv( received_datagram& datagram )
{
  static constexpr size_t MAX_DATAGRAM_SIZE = 65536;

  sockaddr_storage source {};
  socklen_t source_size = sizeof( source );

  datagram.payload.resize( MAX_DATAGRAM_SIZE );

  const ssize_t recv_len = ::recvfrom( fd_num(),
                                       datagram.payload.data(),
                                       datagram.payload.size(),
                                       MSG_TRUNC,
                                       reinterpret_cast<sockaddr*>( &source ),
                                       &source_size );

  if ( recv_len < 0 ) {
    datagram.payload.clear();
    if ( errno == EAGAIN or errno == EWOULDBLOCK or errno == EINTR ) {
      return false;
    }
    throw unix_error { "recvfrom" };
  }

  register_read();

  /* oversized datagrams are delivered empty so the caller counts them as invalid */
  datagram.payload.resize( size_t( recv_len ) > datagram.payload.size() ? 0 : recv_len );
  datagram.source_address = { reinterpret_cast<sockaddr*>( &source ), source_size };

  return true;
}

received_datagram UDPSocket::recv()
{
  received_datagram ret { { nullptr, 0 }, {} };
  if ( not recv( ret ) ) {
    throw runtime_error( "UDPSocket::recv: no datagram available" );
  }
  return ret;
}

void UDPSocket::sendto( const Address& destination, const string_view payload )
{
  CheckSystemCall( "sendto",
                   ::sendto( fd_num(), payload.data(), payload.length(), 0, destination.raw(), destination.size() ) );
  register_write();
}

void UDPSocket::sendto_ignore_errors( const Address& destination, const string_view payload )
{
  ::sendto( fd_num(), payload.data(), payload.length(), 0, destination.raw(), destination.size() );
  register_write();
}

static ip_mreq make_membership( const Address& group )
{
  if ( not group.is_multicast() ) {
    throw runtime_error( "not a multicast group: " + group.to_string() );
  }

  ip_mreq request {};
  request.imr_multiaddr.s_addr = htonl( group.ipv4_numeric() );
  request.imr_interface.s_addr = htonl( INADDR_ANY );
  return request;
}

void UDPSocket::join_multicast_group( const Address& group )
{
  setsockopt( IPPROTO_IP, IP_ADD_MEMBERSHIP, make_membership( group ) );
}

void UDPSocket::leave_multicast_group( const Address& group )
{
  setsockopt( IPPROTO_IP, IP_DROP_MEMBERSHIP, make_membership( group ) );
}

void UDPSocket::set_multicast_loopback( const bool enabled )
{
  setsockopt( IPPROTO_IP, IP_MULTICAST_LOOP, uint8_t( enabled ) );
}

void UDPSocket::set_multicast_ttl( const uint8_t ttl )
{
  setsockopt( IPPROTO_IP, IP_MULTICAST_TTL, ttl );
}

void TCPSocket::listen( const int backlog )
{
  CheckSystemCall( "listen", ::listen( fd_num(), backlog ) );
}

TCPSocket TCPSocket::accept()
{
  register_read();
  return TCPSocket( FileDescriptor( CheckSystemCall( "accept", ::accept4( fd_num(), nullptr, nullptr, SOCK_CLOEXEC ) ) ) );
}

void TCPSocket::set_nodelay()
{
  setsockopt( IPPROTO_TCP, TCP_NODELAY, int( true ) );
}
