#include <cstdlib>
#include <iostream>
#include <unistd.h>

#include "exception.hh"
#include "session.hh"
#include "test_util.hh"
#include "timer.hh"

using namespace std;

static const Session::Ports TEST_PORTS { 47060, 47061 };

static CallInfo make_call( const string& prefix, const vector<string>& participants )
{
  return { 9, "alice", participants, { prefix + ".1", prefix + ".2", prefix + ".3" } };
}

class UnitSender
{
  CipherSession cipher_;
  uint64_t session_nonce_;

public:
  explicit UnitSender( const SessionKeys& keys )
    : cipher_( keys )
    , session_nonce_( keys.session_nonce )
  {}

  string seal( const string& source,
               const uint64_t sequence,
               const Medium medium = Medium::Audio,
               const uint64_t packet_nonce = random_nonce() ) const
  {
    return seal_with_nonce( source, sequence, session_nonce_, medium, packet_nonce );
  }

  string seal_with_nonce( const string& source,
                          const uint64_t sequence,
                          const uint64_t session_nonce,
                          const Medium medium = Medium::Audio,
                          const uint64_t packet_nonce = random_nonce() ) const
  {
    MediaUnit unit;
    unit.medium = medium;
    unit.sequence = sequence;
    unit.session_nonce = session_nonce;
    unit.packet_nonce = packet_nonce;
    unit.source = source;
    unit.timestamp = Timer::wall_clock_s();
    unit.payload = "payload " + to_string( sequence );
    return seal_unit( cipher_, unit );
  }
};

void test_receive_path()
{
  const auto keys = SessionKeys::generate();
  const UnitSender sender { keys };

  Session session { "bob", make_call( "239.255.71", { "alice", "bob", "carol" } ), {}, nullptr, TEST_PORTS };

  expect( not session.accept( sender.seal( "carol", 0 ), Medium::Audio ).has_value(), "nothing before keys" );
  expect_eq( session.statistics().rejected, 0u, "not counted before keys" );

  session.install_keys( keys );

  expect( not session.accept( "garbage", Medium::Audio ).has_value(), "garbage" );
  expect_eq( session.statistics().undecryptable, 1u, "garbage counted" );

  const UnitSender stranger { SessionKeys::generate() };
  expect( not session.accept( stranger.seal( "carol", 0 ), Medium::Audio ).has_value(), "other call's key" );
  expect_eq( session.statistics().undecryptable, 2u, "wrong key counted" );

  expect( not session.accept( sender.seal_with_nonce( "carol", 0, keys.session_nonce + 1 ), Medium::Audio )
                .has_value(),
          "foreign session nonce" );
  expect_eq( session.statistics().foreign_nonce, 1u, "foreign nonce counted" );

  expect( not session.accept( sender.seal( "bob", 0 ), Medium::Audio ).has_value(), "own unit looped back" );
  expect_eq( session.statistics().loopback, 1u, "loopback counted" );

  expect( not session.accept( sender.seal( "carol", 0, Medium::Video ), Medium::Audio ).has_value(),
          "video on the audio group" );
  expect_eq( session.statistics().rejected, 1u, "wrong medium counted" );

  const auto unit = session.accept( sender.seal( "carol", 0, Medium::Audio, 77 ), Medium::Audio );
  expect( unit.has_value(), "valid unit accepted" );
  expect_eq( unit->source, "carol", "source" );
  expect_eq( unit->payload, "payload 0", "payload" );

  expect( not session.accept( sender.seal( "carol", 1, Medium::Audio, 77 ), Medium::Audio ).has_value(),
          "replayed packet nonce" );
  expect_eq( session.statistics().rejected, 2u, "replay counted" );

  expect( session.accept( sender.seal( "carol", 1 ), Medium::Audio ).has_value(), "fresh nonce accepted" );

  expect( not session.accept( sender.seal( "mallory", 0 ), Medium::Audio ).has_value(), "not a participant" );
  expect_eq( session.statistics().rejected, 3u, "outsider counted" );

  const auto snapshots = session.tracker_snapshots();
  expect_eq( snapshots.size(), 1u, "one tracker" );
  expect( snapshots.count( { "carol", Medium::Audio } ) == 1, "tracker for carol's audio" );
}

void test_rejoining_participant()
{
  const auto keys = SessionKeys::generate();
  const UnitSender sender { keys };

  const auto full = make_call( "239.255.72", { "alice", "bob", "carol" } );
  const auto without_carol = make_call( "239.255.72", { "alice", "bob" } );

  Session session { "bob", full, {}, nullptr, TEST_PORTS };
  session.install_keys( keys );

  for ( uint64_t sequence = 0; sequence < 20; sequence++ ) {
    expect( session.accept( sender.seal( "carol", sequence ), Medium::Audio ).has_value(), "first stint" );
  }

  session.update_call( without_carol );
  expect( session.tracker_snapshots().empty(), "departed participant's tracker dropped" );
  expect( not session.accept( sender.seal( "carol", 20 ), Medium::Audio ).has_value(),
          "units from a departed participant are dropped" );
  expect( session.tracker_snapshots().empty(), "no tracker recreated for a departed participant" );

  /* back in the call with a new session: sequence numbers restart */
  session.update_call( full );
  unsigned int accepted = 0;
  for ( uint64_t sequence = 0; sequence < 10; sequence++ ) {
    if ( session.accept( sender.seal( "carol", sequence ), Medium::Audio ).has_value() ) {
      accepted++;
    }
  }
  expect_eq( accepted, 10u, "rejoined participant starts from a fresh tracker" );
}

void test_departed_playback_stops()
{
  const auto keys = SessionKeys::generate();
  const UnitSender sender { keys };

  const auto full = make_call( "239.255.73", { "alice", "bob", "carol" } );
  Session session { "bob", full, {}, nullptr, TEST_PORTS };
  session.install_keys( keys );

  /* carol's audio over multicast loopback starts a playback worker */
  UDPSocket carol;
  carol.set_multicast_loopback( true );
  carol.set_multicast_ttl( 1 );
  const Address audio_group { full.addresses.audio, TEST_PORTS.content };

  const uint64_t deadline = Timer::timestamp_ns() + 3'000'000'000;
  uint64_t sequence = 0;
  try {
    while ( session.playback_count() == 0 and Timer::timestamp_ns() < deadline ) {
      carol.sendto( audio_group, sender.seal( "carol", sequence++ ) );
      usleep( 50'000 );
    }
  } catch ( const unix_error& e ) {
    cerr << "session: no multicast route, skipping playback check (" << e.what() << ")\n";
    return;
  }

  if ( session.playback_count() == 0 ) {
    cerr << "session: multicast loopback not delivered, skipping playback check\n";
    return;
  }

  session.update_call( make_call( "239.255.73", { "alice", "bob" } ) );
  expect_eq( session.playback_count(), 0u, "departed participant's playback worker stopped" );
}

void program_body()
{
  test_receive_path();
  test_rejoining_participant();
  test_departed_playback_stops();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "session: all tests passed\n";
  return EXIT_SUCCESS;
}
