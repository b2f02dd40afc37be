#include "base64.hh"

#include <openssl/evp.h>

using namespace std;

string base64_encode( const string_view input )
{
  string ret;
  ret.resize( 4 * ( ( input.size() + 2 ) / 3 ) + 1 );

  const int written = EVP_EncodeBlock(
    reinterpret_cast<unsigned char*>( ret.data() ), reinterpret_cast<const unsigned char*>( input.data() ), input.size() );

  ret.resize( written );
  return ret;
}

bool base64_decode( const string_view input, string& output )
{
  output.clear();

  if ( input.size() % 4 ) {
    return false;
  }

  if ( input.empty() ) {
    return true;
  }

  output.resize( 3 * input.size() / 4 );
  const int written = EVP_DecodeBlock(
    reinterpret_cast<unsigned char*>( output.data() ), reinterpret_cast<const unsigned char*>( input.data() ), input.size() );
  if ( written < 0 ) {
    output.clear();
    return false;
  }

  /* EVP_DecodeBlock keeps the bytes that stand in for '=' padding */
  size_t padding = 0;
  if ( input.back() == '=' ) {
    padding++;
    if ( input.at( input.size() - 2 ) == '=' ) {
      padding++;
    }
  }

  output.resize( written - padding );
  return true;
}
