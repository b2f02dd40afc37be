#include <cstdlib>
#include <iostream>

#include "base64.hh"
#include "crypto.hh"
#include "test_util.hh"

using namespace std;

void test_base64()
{
  expect_eq( base64_encode( "" ), "", "empty" );
  expect_eq( base64_encode( "f" ), "Zg==", "one byte" );
  expect_eq( base64_encode( "fo" ), "Zm8=", "two bytes" );
  expect_eq( base64_encode( "foobar" ), "Zm9vYmFy", "no padding" );

  string decoded;
  expect( base64_decode( "Zm9vYg==", decoded ), "padded input decodes" );
  expect_eq( decoded, "foob", "padding bytes removed" );

  const string binary { "\x00\x01\xff\x7f\x80", 5 };
  expect( base64_decode( base64_encode( binary ), decoded ), "binary decodes" );
  expect( decoded == binary, "binary survives" );

  expect( not base64_decode( "abc", decoded ), "bad length rejected" );
  expect( not base64_decode( "ab!d", decoded ), "bad alphabet rejected" );
}

void test_aes_zero_padding()
{
  const auto keys = SessionKeys::generate();
  expect( keys.valid(), "generated keys have the right lengths" );

  const CipherSession cipher { keys };

  for ( const string plaintext : { "x", "exactly sixteen!", "a longer message spanning several AES blocks" } ) {
    const string ciphertext = cipher.encrypt( plaintext );
    expect_eq( ciphertext.size() % CipherSession::BLOCK_LEN, 0u, "ciphertext is whole blocks" );
    expect( ciphertext.size() >= plaintext.size(), "ciphertext covers the plaintext" );

    string decrypted;
    expect( cipher.decrypt( ciphertext, decrypted ), "decrypts" );
    expect_eq( decrypted, plaintext, "round trip" );
  }

  /* a block-aligned plaintext gets no extra block */
  expect_eq( cipher.encrypt( "exactly sixteen!" ).size(), 16u, "no padding block when aligned" );

  /* trailing zero bytes are indistinguishable from padding */
  string decrypted;
  expect( cipher.decrypt( cipher.encrypt( string( "abc\0\0", 5 ) ), decrypted ), "decrypts" );
  expect_eq( decrypted, "abc", "trailing zeros stripped" );

  expect( not cipher.decrypt( "", decrypted ), "empty ciphertext rejected" );
  expect( not cipher.decrypt( "short", decrypted ), "partial block rejected" );

  /* same key and IV give the same ciphertext, so another participant can decrypt */
  const CipherSession other { keys };
  expect( other.decrypt( cipher.encrypt( "shared" ), decrypted ) and decrypted == "shared", "shared keys interoperate" );

  const CipherSession stranger { SessionKeys::generate() };
  expect( not stranger.decrypt( cipher.encrypt( "shared" ), decrypted ) or decrypted != "shared",
          "a different key does not recover the plaintext" );

  expect_throws<runtime_error>( [] { CipherSession bad { SessionKeys { "short", "iv", 0 } }; },
                                "invalid key length rejected" );
}

void test_rsa_oaep()
{
  const KeyPair keypair;
  const string pem = keypair.public_key_pem();
  expect( pem.find( "BEGIN PUBLIC KEY" ) != string::npos, "PEM public key" );

  string ciphertext;
  expect( KeyPair::encrypt_for( pem, "session secret", ciphertext ), "encrypts under the public key" );
  expect_eq( ciphertext.size(), size_t( KeyPair::MODULUS_BITS / 8 ), "one RSA block" );

  string plaintext;
  expect( keypair.decrypt( ciphertext, plaintext ), "private key decrypts" );
  expect_eq( plaintext, "session secret", "RSA round trip" );

  const KeyPair other;
  expect( not other.decrypt( ciphertext, plaintext ), "another private key fails OAEP" );

  ciphertext[10] ^= 0x01;
  expect( not keypair.decrypt( ciphertext, plaintext ), "tampered ciphertext fails OAEP" );

  expect( not KeyPair::encrypt_for( "not a key", "x", ciphertext ), "garbage PEM rejected" );
}

void test_nonces()
{
  expect_eq( random_bytes( 32 ).size(), 32u, "random_bytes length" );
  expect( random_nonce() != random_nonce(), "nonces differ" );
  expect( SessionKeys::generate().key != SessionKeys::generate().key, "keys differ" );
}

void program_body()
{
  test_base64();
  test_aes_zero_padding();
  test_rsa_oaep();
  test_nonces();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "crypto: all tests passed\n";
  return EXIT_SUCCESS;
}
