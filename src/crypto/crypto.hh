#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

std::string random_bytes( const size_t length );
uint64_t random_nonce();

/* symmetric material shared by every participant of a call */
struct SessionKeys
{
  static constexpr size_t KEY_LEN = 16;
  static constexpr size_t IV_LEN = 16;

  std::string key {};
  std::string iv {};
  uint64_t session_nonce {};

  static SessionKeys generate();
  bool valid() const { return key.size() == KEY_LEN and iv.size() == IV_LEN; }
};

/* AES-128-CBC over whole units, zero-padded to the block size */
class CipherSession
{
  SessionKeys keys_;

public:
  static constexpr size_t BLOCK_LEN = 16;

  explicit CipherSession( const SessionKeys& keys );

  std::string encrypt( const std::string_view plaintext ) const;

  /* trailing zero padding is removed; false if the ciphertext is malformed */
  bool decrypt( const std::string_view ciphertext, std::string& plaintext ) const;

  uint64_t session_nonce() const { return keys_.session_nonce; }
  const SessionKeys& keys() const { return keys_; }
};

/* RSA-2048 keypair used once per handshake to receive the session key */
class KeyPair
{
  struct pkey_deleter
  {
    void operator()( EVP_PKEY* x ) const { EVP_PKEY_free( x ); }
  };

  std::unique_ptr<EVP_PKEY, pkey_deleter> pkey_;

public:
  static constexpr int MODULUS_BITS = 2048;

  KeyPair();

  std::string public_key_pem() const;
  bool decrypt( const std::string_view ciphertext, std::string& plaintext ) const;

  /* RSA-OAEP under a PEM public key received from the network; false if the key is unusable */
  static bool encrypt_for( const std::string_view public_key_pem,
                           const std::string_view plaintext,
                           std::string& ciphertext );
};
