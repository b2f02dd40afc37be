#include <cstdlib>
#include <iostream>

#include "base64.hh"
#include "framing.hh"
#include "test_util.hh"

using namespace std;

static MediaUnit sample_unit( const uint64_t session_nonce )
{
  MediaUnit unit;
  unit.medium = Medium::Video;
  unit.sequence = 42;
  unit.session_nonce = session_nonce;
  unit.packet_nonce = 0x1234567890abcdefULL;
  unit.source = "alice";
  unit.timestamp = 1700000000.25;
  unit.payload = string( "\x00\x01jpeg\xff", 7 );
  return unit;
}

void test_seal_and_open()
{
  const auto keys = SessionKeys::generate();
  const CipherSession cipher { keys };

  const auto unit = sample_unit( keys.session_nonce );
  const string datagram = seal_unit( cipher, unit );

  /* the wire format is a session/content message; nothing of the unit is visible */
  const auto message = decode_message( datagram );
  expect( message.has_value() and holds_alternative<SessionContent>( message.value() ), "session/content wrapper" );
  expect( datagram.find( "alice" ) == string::npos, "source is encrypted" );

  const auto opened = open_unit( cipher, datagram );
  expect( opened.has_value(), "opens under the same key" );
  expect( opened->medium == Medium::Video, "medium" );
  expect_eq( opened->sequence, 42u, "sequence" );
  expect_eq( opened->session_nonce, keys.session_nonce, "session nonce" );
  expect_eq( opened->packet_nonce, 0x1234567890abcdefULL, "packet nonce" );
  expect_eq( opened->source, "alice", "source" );
  expect_near( opened->timestamp, 1700000000.25, 1e-6, "timestamp" );
  expect( opened->payload == unit.payload, "binary payload intact" );
}

void test_rejections()
{
  const auto keys = SessionKeys::generate();
  const CipherSession cipher { keys };
  const string datagram = seal_unit( cipher, sample_unit( keys.session_nonce ) );

  OpenError error {};

  expect( not open_unit( cipher, serialize( UiLeave {} ), &error ).has_value(), "not content" );
  expect( error == OpenError::NotContent, "not content reason" );

  expect( not open_unit( cipher, "{not json", &error ).has_value(), "garbage" );
  expect( error == OpenError::NotContent, "garbage reason" );

  const CipherSession stranger { SessionKeys::generate() };
  expect( not open_unit( stranger, datagram, &error ).has_value(), "wrong key" );
  expect( error == OpenError::Malformed, "wrong key yields garbage" );

  /* flip a bit in the first ciphertext block */
  string ciphertext;
  expect( base64_decode( get<SessionContent>( decode_message( datagram ).value() ).payload, ciphertext ), "payload" );
  ciphertext[0] ^= 0x40;
  const string tampered = serialize( SessionContent { base64_encode( ciphertext ) } );
  expect( not open_unit( cipher, tampered, &error ).has_value(), "tampered" );
  expect( error == OpenError::Malformed, "tampered reason" );

  /* truncated to a partial block */
  const string truncated = serialize( SessionContent { base64_encode( ciphertext.substr( 0, 20 ) ) } );
  expect( not open_unit( cipher, truncated, &error ).has_value(), "truncated" );
  expect( error == OpenError::Undecryptable, "truncated reason" );

  const string bad_base64 = serialize( SessionContent { "***" } );
  expect( not open_unit( cipher, bad_base64, &error ).has_value(), "bad base64" );
  expect( error == OpenError::Undecryptable, "bad base64 reason" );

  expect( not open_unit( cipher, serialize( SessionContent { base64_encode( cipher.encrypt( "{\"medium\":\"smell\"}" ) ) } ), &error )
                .has_value(),
          "incomplete unit" );
  expect( error == OpenError::Malformed, "incomplete unit reason" );
}

void program_body()
{
  test_seal_and_open();
  test_rejections();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "framing: all tests passed\n";
  return EXIT_SUCCESS;
}
