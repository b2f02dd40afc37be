#include "address_pool.hh"
#include "address.hh"

#include <stdexcept>

using namespace std;

string MulticastAddressPool::dotted_quad( const uint32_t address )
{
  return Address::from_ipv4_numeric( address ).ip();
}

string MulticastAddressPool::allocate()
{
  uint32_t host;

  if ( not free_list_.empty() ) {
    host = free_list_.back();
    free_list_.pop_back();
  } else {
    if ( next_ >= HOST_SPACE ) {
      throw runtime_error( "multicast address pool exhausted" );
    }
    host = next_++;
  }

  const uint32_t address = PREFIX | host;
  in_use_.insert( address );
  return dotted_quad( address );
}

void MulticastAddressPool::release( const string& address )
{
  const uint32_t numeric = Address { address, uint16_t( 0 ) }.ipv4_numeric();
  if ( not in_use_.erase( numeric ) ) {
    throw runtime_error( "release of multicast address not in use: " + address );
  }

  free_list_.push_back( numeric & ( HOST_SPACE - 1 ) );
}

bool MulticastAddressPool::is_in_use( const string& address ) const
{
  return in_use_.count( Address { address, uint16_t( 0 ) }.ipv4_numeric() );
}
