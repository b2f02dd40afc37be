#include <cstdlib>
#include <functional>
#include <iostream>

#include "directory_server.hh"
#include "test_util.hh"
#include "timer.hh"

using namespace std;

/* one client control stream, read without blocking the server's loop */
class TestClient
{
  TCPSocket socket_ {};
  JsonStreamDecoder decoder_ {};
  vector<Message> received_ {};

public:
  explicit TestClient( const Address& server )
  {
    socket_.connect( server );
    socket_.set_blocking( false );
  }

  void send( const Message& message ) { socket_.write( serialize( message ) ); }

  void poll()
  {
    string chunk;
    socket_.read( chunk );
    decoder_.push( chunk );
    while ( auto root = decoder_.pop() ) {
      if ( auto message = parse_message( root.value() ) ) {
        received_.push_back( move( message.value() ) );
      }
    }
  }

  template<class T>
  vector<T> received() const
  {
    vector<T> matches;
    for ( const auto& message : received_ ) {
      if ( holds_alternative<T>( message ) ) {
        matches.push_back( get<T>( message ) );
      }
    }
    return matches;
  }

  void close() { socket_.close(); }
};

static void run_until( EventLoop& loop,
                       vector<TestClient*> clients,
                       const function<bool()>& done,
                       const uint64_t timeout_ms = 10000 )
{
  const uint64_t deadline = Timer::timestamp_ns() + timeout_ms * 1'000'000;
  while ( not done() ) {
    if ( Timer::timestamp_ns() > deadline ) {
      throw runtime_error( "timed out waiting for the directory server" );
    }
    loop.wait_next_event( 20 );
    for ( auto client : clients ) {
      client->poll();
    }
  }
}

void test_join_and_call_over_tcp()
{
  EventLoop loop;
  DirectoryServer server { loop, { "127.0.0.1", uint16_t( 0 ) }, TaskQueue::DEFAULT_TTL_MS };
  const Address address { "127.0.0.1", server.local_address().port() };

  TestClient alice { address }, bob { address }, impostor { address };
  const vector<TestClient*> everyone { &alice, &bob, &impostor };

  alice.send( JoinRequest { "alice" } );
  run_until( loop, everyone, [&] { return alice.received<JoinResponse>().size() == 1; } );
  expect( alice.received<JoinResponse>()[0].ok, "alice joined" );

  bob.send( JoinRequest { "bob" } );
  run_until( loop, everyone, [&] {
    return alice.received<UserUpdate>().size() == 1 and bob.received<JoinResponse>().size() == 1;
  } );
  const auto bob_response = bob.received<JoinResponse>();
  expect( bob_response.size() == 1 and bob_response[0].ok, "bob joined" );
  expect( bob_response[0].users.size() == 1 and bob_response[0].users[0].name == "alice", "bob sees alice" );
  expect_eq( alice.received<UserUpdate>()[0].name, "bob", "alice hears about bob" );

  impostor.send( JoinRequest { "alice" } );
  run_until( loop, everyone, [&] { return impostor.received<JoinResponse>().size() == 1; } );
  expect( not impostor.received<JoinResponse>()[0].ok, "duplicate name refused" );
  expect_eq( server.registry().user_count(), 2u, "two users" );

  /* messages the directory does not handle are ignored */
  impostor.send( UiLeave {} );
  alice.send( CallRequest { "bob" } );
  run_until( loop, everyone, [&] { return bob.received<CallParticipate>().size() == 1; } );
  expect_eq( bob.received<CallParticipate>()[0].caller, "alice", "bob is prompted" );

  bob.send( CalleeResponse { "alice", "bob", true } );
  run_until( loop, everyone, [&] {
    return alice.received<CalleeResponse>().size() == 1 and alice.received<CallUpdate>().size() == 1
           and bob.received<CallUpdate>().size() == 1;
  } );
  expect( alice.received<CalleeResponse>()[0].accept, "caller hears the answer" );
  expect( bob.received<CallUpdate>()[0].kind == CallUpdate::Kind::CallAdd, "call_add" );
  expect_eq( server.registry().call_count(), 1u, "one call" );
  expect( impostor.received<CallUpdate>().empty(), "connections that never joined hear nothing" );
}

void test_disconnect_cleanup()
{
  EventLoop loop;
  DirectoryServer server { loop, { "127.0.0.1", uint16_t( 0 ) }, TaskQueue::DEFAULT_TTL_MS };
  const Address address { "127.0.0.1", server.local_address().port() };

  TestClient alice { address }, bob { address };

  alice.send( JoinRequest { "alice" } );
  bob.send( JoinRequest { "bob" } );
  run_until( loop, { &alice, &bob }, [&] { return server.registry().user_count() == 2; } );
  expect_eq( server.connection_count(), 2u, "two connections" );

  alice.send( CallRequest { "bob" } );
  run_until( loop, { &alice, &bob }, [&] { return bob.received<CallParticipate>().size() == 1; } );
  bob.send( CalleeResponse { "alice", "bob", true } );
  run_until( loop, { &alice, &bob }, [&] { return server.registry().call_count() == 1; } );

  bob.close();
  run_until( loop, { &alice }, [&] { return server.connection_count() == 1; } );

  expect_eq( server.registry().user_count(), 1u, "bob removed" );
  expect_eq( server.registry().call_count(), 0u, "a one-person call is dissolved" );

  run_until( loop, { &alice }, [&] {
    for ( const auto& update : alice.received<UserUpdate>() ) {
      if ( update.kind == UserUpdate::Kind::Leave and update.name == "bob" ) {
        return true;
      }
    }
    return false;
  } );
}

void program_body()
{
  test_join_and_call_over_tcp();
  test_disconnect_cleanup();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "directory_server: all tests passed\n";
  return EXIT_SUCCESS;
}
