#include "crypto.hh"
#include "exception.hh"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

#include <array>
#include <cstring>

using namespace std;

namespace {

struct cipher_ctx_deleter
{
  void operator()( EVP_CIPHER_CTX* x ) const { EVP_CIPHER_CTX_free( x ); }
};

struct pkey_ctx_deleter
{
  void operator()( EVP_PKEY_CTX* x ) const { EVP_PKEY_CTX_free( x ); }
};

struct bio_deleter
{
  void operator()( BIO* x ) const { BIO_free( x ); }
};

using CipherContext = unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;
using PKeyContext = unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter>;
using MemoryBIO = unique_ptr<BIO, bio_deleter>;

string openssl_error_string()
{
  array<char, 256> buf {};
  ERR_error_string_n( ERR_get_error(), buf.data(), buf.size() );
  return buf.data();
}

void openssl_check( const string_view context, const int retval )
{
  if ( retval <= 0 ) {
    throw runtime_error( string( context ) + ": " + openssl_error_string() );
  }
}

const unsigned char* as_uchar( const string_view str )
{
  return reinterpret_cast<const unsigned char*>( str.data() );
}

unsigned char* as_uchar( string& str )
{
  return reinterpret_cast<unsigned char*>( str.data() );
}

}

string random_bytes( const size_t length )
{
  string ret( length, '\0' );
  openssl_check( "RAND_bytes", RAND_bytes( as_uchar( ret ), length ) );
  return ret;
}

uint64_t random_nonce()
{
  const string bytes = random_bytes( sizeof( uint64_t ) );
  uint64_t ret;
  memcpy( &ret, bytes.data(), sizeof( ret ) );
  return ret;
}

SessionKeys SessionKeys::generate()
{
  return { random_bytes( KEY_LEN ), random_bytes( IV_LEN ), random_nonce() };
}

CipherSession::CipherSession( const SessionKeys& keys )
  : keys_( keys )
{
  if ( not keys_.valid() ) {
    throw runtime_error( "CipherSession: invalid key or IV length" );
  }
}

string CipherSession::encrypt( const string_view plaintext ) const
{
  string padded { plaintext };
  padded.resize( BLOCK_LEN * ( ( plaintext.size() + BLOCK_LEN - 1 ) / BLOCK_LEN ), '\0' );

  CipherContext ctx { notnull( "EVP_CIPHER_CTX_new", EVP_CIPHER_CTX_new() ) };
  openssl_check( "EVP_EncryptInit_ex",
                 EVP_EncryptInit_ex(
                   ctx.get(), EVP_aes_128_cbc(), nullptr, as_uchar( keys_.key ), as_uchar( keys_.iv ) ) );
  openssl_check( "EVP_CIPHER_CTX_set_padding", EVP_CIPHER_CTX_set_padding( ctx.get(), 0 ) );

  string ciphertext( padded.size() + BLOCK_LEN, '\0' );
  int update_len = 0, final_len = 0;
  openssl_check( "EVP_EncryptUpdate",
                 EVP_EncryptUpdate( ctx.get(), as_uchar( ciphertext ), &update_len, as_uchar( padded ), padded.size() ) );
  openssl_check( "EVP_EncryptFinal_ex",
                 EVP_EncryptFinal_ex( ctx.get(), as_uchar( ciphertext ) + update_len, &final_len ) );

  ciphertext.resize( update_len + final_len );
  return ciphertext;
}

bool CipherSession::decrypt( const string_view ciphertext, string& plaintext ) const
{
  plaintext.clear();

  if ( ciphertext.empty() or ciphertext.size() % BLOCK_LEN ) {
    return false;
  }

  CipherContext ctx { notnull( "EVP_CIPHER_CTX_new", EVP_CIPHER_CTX_new() ) };
  if ( EVP_DecryptInit_ex( ctx.get(), EVP_aes_128_cbc(), nullptr, as_uchar( keys_.key ), as_uchar( keys_.iv ) ) <= 0
       or EVP_CIPHER_CTX_set_padding( ctx.get(), 0 ) <= 0 ) {
    return false;
  }

  plaintext.resize( ciphertext.size() + BLOCK_LEN );
  int update_len = 0, final_len = 0;
  if ( EVP_DecryptUpdate(
         ctx.get(), as_uchar( plaintext ), &update_len, as_uchar( ciphertext ), ciphertext.size() )
         <= 0
       or EVP_DecryptFinal_ex( ctx.get(), as_uchar( plaintext ) + update_len, &final_len ) <= 0 ) {
    ERR_clear_error();
    plaintext.clear();
    return false;
  }

  plaintext.resize( update_len + final_len );

  /* strip zero padding */
  const auto last = plaintext.find_last_not_of( '\0' );
  plaintext.resize( last == string::npos ? 0 : last + 1 );

  return true;
}

KeyPair::KeyPair()
  : pkey_()
{
  PKeyContext ctx { notnull( "EVP_PKEY_CTX_new_id", EVP_PKEY_CTX_new_id( EVP_PKEY_RSA, nullptr ) ) };
  openssl_check( "EVP_PKEY_keygen_init", EVP_PKEY_keygen_init( ctx.get() ) );
  openssl_check( "EVP_PKEY_CTX_set_rsa_keygen_bits", EVP_PKEY_CTX_set_rsa_keygen_bits( ctx.get(), MODULUS_BITS ) );

  EVP_PKEY* raw_key = nullptr;
  openssl_check( "EVP_PKEY_keygen", EVP_PKEY_keygen( ctx.get(), &raw_key ) );
  pkey_.reset( notnull( "EVP_PKEY_keygen", raw_key ) );
}

string KeyPair::public_key_pem() const
{
  MemoryBIO bio { notnull( "BIO_new", BIO_new( BIO_s_mem() ) ) };
  openssl_check( "PEM_write_bio_PUBKEY", PEM_write_bio_PUBKEY( bio.get(), pkey_.get() ) );

  char* data = nullptr;
  const long len = BIO_get_mem_data( bio.get(), &data );
  if ( len <= 0 or data == nullptr ) {
    throw runtime_error( "BIO_get_mem_data: empty PEM" );
  }

  return { data, size_t( len ) };
}

bool KeyPair::decrypt( const string_view ciphertext, string& plaintext ) const
{
  plaintext.clear();

  PKeyContext ctx { notnull( "EVP_PKEY_CTX_new", EVP_PKEY_CTX_new( pkey_.get(), nullptr ) ) };
  size_t out_len = 0;
  if ( EVP_PKEY_decrypt_init( ctx.get() ) <= 0
       or EVP_PKEY_CTX_set_rsa_padding( ctx.get(), RSA_PKCS1_OAEP_PADDING ) <= 0
       or EVP_PKEY_decrypt( ctx.get(), nullptr, &out_len, as_uchar( ciphertext ), ciphertext.size() ) <= 0 ) {
    ERR_clear_error();
    return false;
  }

  plaintext.resize( out_len );
  if ( EVP_PKEY_decrypt( ctx.get(), as_uchar( plaintext ), &out_len, as_uchar( ciphertext ), ciphertext.size() )
       <= 0 ) {
    ERR_clear_error();
    plaintext.clear();
    return false;
  }

  plaintext.resize( out_len );
  return true;
}

bool KeyPair::encrypt_for( const string_view public_key_pem, const string_view plaintext, string& ciphertext )
{
  ciphertext.clear();

  MemoryBIO bio { notnull( "BIO_new_mem_buf", BIO_new_mem_buf( public_key_pem.data(), public_key_pem.size() ) ) };
  unique_ptr<EVP_PKEY, pkey_deleter> peer_key { PEM_read_bio_PUBKEY( bio.get(), nullptr, nullptr, nullptr ) };
  if ( not peer_key ) {
    ERR_clear_error();
    return false;
  }

  PKeyContext ctx { notnull( "EVP_PKEY_CTX_new", EVP_PKEY_CTX_new( peer_key.get(), nullptr ) ) };
  size_t out_len = 0;
  if ( EVP_PKEY_encrypt_init( ctx.get() ) <= 0
       or EVP_PKEY_CTX_set_rsa_padding( ctx.get(), RSA_PKCS1_OAEP_PADDING ) <= 0
       or EVP_PKEY_encrypt( ctx.get(), nullptr, &out_len, as_uchar( plaintext ), plaintext.size() ) <= 0 ) {
    ERR_clear_error();
    return false;
  }

  ciphertext.resize( out_len );
  if ( EVP_PKEY_encrypt( ctx.get(), as_uchar( ciphertext ), &out_len, as_uchar( plaintext ), plaintext.size() )
       <= 0 ) {
    ERR_clear_error();
    ciphertext.clear();
    return false;
  }

  ciphertext.resize( out_len );
  return true;
}
