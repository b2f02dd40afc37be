#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>

#include "exception.hh"
#include "key_exchange.hh"
#include "test_util.hh"
#include "timer.hh"

using namespace std;

static void run_until( EventLoop& loop, const function<bool()>& done, const uint64_t timeout_ms = 10000 )
{
  const uint64_t deadline = Timer::timestamp_ns() + timeout_ms * 1'000'000;
  while ( not done() ) {
    if ( Timer::timestamp_ns() > deadline ) {
      throw runtime_error( "timed out waiting for the event loop" );
    }
    loop.wait_next_event( 50 );
  }
}

void test_static_sealing()
{
  const auto keys = SessionKeys::generate();
  const KeyPair keypair;

  const auto info = KeyDistributor::seal_keys( keys, keypair.public_key_pem() );
  expect( info.has_value(), "sealed under a good public key" );

  SessionKeys unsealed;
  expect( KeyRequester::unseal_keys( keypair, info.value(), unsealed ), "unsealed with the private key" );
  expect( unsealed.key == keys.key and unsealed.iv == keys.iv, "key and IV" );
  expect_eq( unsealed.session_nonce, keys.session_nonce, "session nonce" );

  const KeyPair other;
  expect( not KeyRequester::unseal_keys( other, info.value(), unsealed ), "only the requester can unseal" );

  expect( not KeyDistributor::seal_keys( keys, "garbage" ).has_value(), "unusable public key" );
}

void test_handshake_over_loopback()
{
  EventLoop loop;
  const auto keys = SessionKeys::generate();

  KeyDistributor distributor { loop, keys, Address { "127.0.0.1", uint16_t( 0 ) } };
  expect( distributor.port() != 0, "ephemeral port" );

  optional<SessionKeys> received;
  KeyRequester requester { loop,
                           Address { "127.0.0.1", distributor.port() },
                           "bob",
                           [&]( const SessionKeys& k ) { received = k; } };

  run_until( loop, [&] { return requester.finished(); } );

  expect( requester.state() == KeyRequester::State::Done, "handshake completed" );
  expect( received.has_value(), "callback ran" );
  expect( received->key == keys.key and received->iv == keys.iv, "same key material" );
  expect_eq( received->session_nonce, keys.session_nonce, "same session nonce" );
  expect_eq( distributor.served(), 1u, "one requester served" );

  /* and the two sides can now talk */
  const CipherSession master { keys }, peer { received.value() };
  string plaintext;
  expect( peer.decrypt( master.encrypt( "hello" ), plaintext ) and plaintext == "hello", "shared cipher" );

  /* a second participant gets the same material from the same listener */
  optional<SessionKeys> second;
  KeyRequester another { loop,
                         Address { "127.0.0.1", distributor.port() },
                         "carol",
                         [&]( const SessionKeys& k ) { second = k; } };
  run_until( loop, [&] { return another.finished(); } );
  expect( second.has_value() and second->key == keys.key, "second handshake" );
  expect_eq( distributor.served(), 2u, "two requesters served" );
}

void test_bad_request_refused()
{
  EventLoop loop;
  KeyDistributor distributor { loop, SessionKeys::generate(), Address { "127.0.0.1", uint16_t( 0 ) } };

  TCPSocket client;
  client.connect( { "127.0.0.1", distributor.port() } );
  client.write( serialize( UiLeave {} ) );

  run_until( loop, [&] { return distributor.refused() == 1; } );
  expect_eq( distributor.served(), 0u, "nothing served" );
}

void test_connection_refused()
{
  /* a bound but not listening socket refuses connections */
  TCPSocket placeholder;
  placeholder.bind( { "127.0.0.1", uint16_t( 0 ) } );
  const Address nowhere = placeholder.local_address();

  EventLoop loop;
  bool called = false;
  unique_ptr<KeyRequester> requester;
  try {
    requester = make_unique<KeyRequester>( loop, nowhere, "bob", [&]( const SessionKeys& ) { called = true; } );
  } catch ( const unix_error& ) {
    /* refused before connect() returned */
    return;
  }

  run_until( loop, [&] { return requester->finished(); } );
  expect( requester->state() == KeyRequester::State::Failed, "refused connection fails the request" );
  expect( not called, "no keys" );
}

void test_connect_does_not_block()
{
  /* TEST-NET-1 is never routed to a real host: the connect either fails at once or stays in progress */
  EventLoop loop;
  const uint64_t start = Timer::timestamp_ns();

  try {
    KeyRequester requester { loop, Address { "192.0.2.1", uint16_t( 9 ) }, "bob", []( const SessionKeys& ) {} };
    expect( Timer::timestamp_ns() - start < 1'000'000'000, "constructor returns without waiting for the connect" );
    expect( requester.state() != KeyRequester::State::Done, "no keys from an unreachable master" );
    expect( not requester.timed_out(), "deadline not reached yet" );
  } catch ( const unix_error& ) {
    /* no route at all on this host */
    expect( Timer::timestamp_ns() - start < 1'000'000'000, "unreachable network fails fast" );
  }
}

void program_body()
{
  test_static_sealing();
  test_handshake_over_loopback();
  test_bad_request_refused();
  test_connection_refused();
  test_connect_does_not_block();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "key_exchange: all tests passed\n";
  return EXIT_SUCCESS;
}
