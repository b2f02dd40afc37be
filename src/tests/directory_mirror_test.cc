#include <cstdlib>
#include <iostream>

#include "directory.hh"
#include "test_util.hh"

using namespace std;

static CallInfo make_call( const uint64_t id, const string& master, const vector<string>& participants )
{
  return { id, master, participants, { "239.0.0.1", "239.0.0.2", "239.0.0.3" } };
}

void test_roster()
{
  DirectoryMirror mirror;

  expect( not mirror.apply( JoinResponse { false, "bob", {}, {} } ), "rejected join" );
  expect( not mirror.joined(), "not joined after rejection" );

  const auto existing = make_call( 3, "alice", { "alice", "carol" } );
  expect( mirror.apply( JoinResponse { true, "bob", { { "alice", UserStatus::InCall } }, { existing } } ),
          "accepted join" );
  expect( mirror.joined() and mirror.self() == "bob", "self recorded" );
  expect_eq( mirror.users().size(), 1u, "snapshot users" );
  expect_eq( mirror.calls().size(), 1u, "snapshot calls" );

  mirror.apply( UserUpdate { UserUpdate::Kind::Join, "dave", UserStatus::Available } );
  mirror.apply( UserUpdate { UserUpdate::Kind::Status, "bob", UserStatus::InCall } );
  expect_eq( mirror.users().size(), 2u, "updates about self are not listed" );

  mirror.apply( UserUpdate { UserUpdate::Kind::Status, "dave", UserStatus::InCall } );
  mirror.apply( UserUpdate { UserUpdate::Kind::Leave, "alice", UserStatus::Available } );
  const auto users = mirror.users();
  expect( users.size() == 1 and users[0].name == "dave" and users[0].status == UserStatus::InCall, "roster" );
}

void test_call_lifecycle()
{
  DirectoryMirror mirror;
  mirror.apply( JoinResponse { true, "bob", {}, {} } );

  /* someone else's call */
  auto change = mirror.apply( CallUpdate { CallUpdate::Kind::CallAdd, "carol", "dave", make_call( 1, "carol", { "carol", "dave" } ) } );
  expect( change.action == DirectoryMirror::SessionAction::None, "other calls do not start a session" );

  change = mirror.apply( CallUpdate { CallUpdate::Kind::CallAdd, "alice", "bob", make_call( 2, "alice", { "alice", "bob" } ) } );
  expect( change.action == DirectoryMirror::SessionAction::Start, "our call starts a session" );
  expect_eq( change.call.id, 2u, "call id" );
  expect_eq( mirror.current_call().value().master, "alice", "current call" );

  change = mirror.apply( CallUpdate { CallUpdate::Kind::UserJoin, "alice", "erin", make_call( 2, "alice", { "alice", "bob", "erin" } ) } );
  expect( change.action == DirectoryMirror::SessionAction::Update, "roster change updates the session" );

  change = mirror.apply( CallUpdate { CallUpdate::Kind::UserLeave, "bob", "alice", make_call( 2, "bob", { "bob", "erin" } ) } );
  expect( change.action == DirectoryMirror::SessionAction::Update, "master change updates the session" );
  expect_eq( change.call.master, "bob", "new master" );

  /* an unrelated call going away */
  change = mirror.apply( CallUpdate { CallUpdate::Kind::CallRemove, "carol", "dave", make_call( 1, "carol", { "carol" } ) } );
  expect( change.action == DirectoryMirror::SessionAction::None, "unrelated removal" );
  expect_eq( mirror.calls().size(), 1u, "removed from the roster" );

  change = mirror.apply( CallUpdate { CallUpdate::Kind::CallRemove, "bob", "erin", make_call( 2, "bob", { "bob" } ) } );
  expect( change.action == DirectoryMirror::SessionAction::End, "our call dissolved" );
  expect( not mirror.current_call().has_value(), "no current call" );
  expect( mirror.calls().empty(), "roster empty" );
}

void test_leaving_a_live_call()
{
  DirectoryMirror mirror;
  mirror.apply( JoinResponse { true, "bob", {}, {} } );

  mirror.apply( CallUpdate { CallUpdate::Kind::CallAdd, "alice", "bob", make_call( 5, "alice", { "alice", "bob", "carol" } ) } );
  const auto change = mirror.apply( CallUpdate { CallUpdate::Kind::UserLeave, "alice", "bob", make_call( 5, "alice", { "alice", "carol" } ) } );
  expect( change.action == DirectoryMirror::SessionAction::End, "we left the call" );
  expect_eq( mirror.calls().size(), 1u, "the call itself lives on" );

  /* a late user_leave for a call we are no longer in does not restart anything */
  const auto late = mirror.apply( CallUpdate { CallUpdate::Kind::UserLeave, "alice", "carol", make_call( 5, "alice", { "alice", "bob" } ) } );
  expect( late.action == DirectoryMirror::SessionAction::None, "user_leave never starts a session" );
}

void program_body()
{
  test_roster();
  test_call_lifecycle();
  test_leaving_a_live_call();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "directory_mirror: all tests passed\n";
  return EXIT_SUCCESS;
}
