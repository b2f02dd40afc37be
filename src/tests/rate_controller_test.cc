#include <cstdlib>
#include <iostream>

#include "rate_controller.hh"
#include "test_util.hh"

using namespace std;

static Feedback report( const string& source, const unsigned int rate )
{
  return Feedback { source, "alice", rate };
}

void test_non_master_ignores_feedback()
{
  RateController controller;
  expect( not controller.on_feedback( report( "bob", 5 ), false ), "non-master does not adapt" );
  expect_eq( controller.rate(), RateController::INITIAL_RATE, "rate unchanged" );
  expect( not controller.clr().has_value(), "no CLR designated" );
}

void test_clr_selection()
{
  RateController controller;

  expect( controller.on_feedback( report( "bob", 20 ), true ), "first reporter becomes CLR" );
  expect_eq( controller.clr().value(), "bob", "CLR is bob" );
  expect_near( controller.rate(), 0.6 * 30 + 0.4 * 20, 1e-9, "blended rate" );

  expect( not controller.on_feedback( report( "carol", 25 ), true ), "higher report from another peer ignored" );
  expect_near( controller.rate(), 26, 1e-9, "rate unchanged by ignored report" );

  expect( controller.on_feedback( report( "carol", 10 ), true ), "lower report takes over" );
  expect_eq( controller.clr().value(), "carol", "CLR is carol" );
  expect_near( controller.rate(), 0.6 * 26 + 0.4 * 10, 1e-9, "blended toward the new CLR" );

  expect( controller.on_feedback( report( "bob", 5 ), true ), "bob is lower than carol's last report" );
  expect_eq( controller.clr().value(), "bob", "CLR is bob again" );
  expect_near( controller.rate(), 0.6 * 19.6 + 0.4 * 5, 1e-9, "blend" );

  expect( controller.on_feedback( report( "bob", 40 ), true ), "the CLR's own report is always adopted" );
  expect_near( controller.rate(), 0.6 * 13.76 + 0.4 * 40, 1e-9, "blend upward" );
  expect_eq( controller.adopted(), 4u, "adopted count" );
  expect_eq( controller.ignored(), 1u, "ignored count" );
}

void test_clr_cleared()
{
  RateController controller;

  controller.on_feedback( report( "bob", 10 ), true );
  controller.on_participant_left( "carol" );
  expect_eq( controller.clr().value(), "bob", "unrelated departure keeps the CLR" );

  controller.on_participant_left( "bob" );
  expect( not controller.clr().has_value(), "CLR cleared when it leaves" );

  expect( controller.on_feedback( report( "carol", 90 ), true ), "any report adopted without a CLR" );
  expect_eq( controller.clr().value(), "carol", "new CLR" );
  expect( controller.rate() > RateController::MAX_RATE, "raw rate can exceed the cap" );
  expect_eq( controller.clamped_rate(), RateController::MAX_RATE, "sender rate is capped" );

  controller.on_master_changed();
  expect( not controller.clr().has_value(), "CLR cleared when mastership moves" );
}

void test_clamp_floor()
{
  RateController controller { 0.2 };
  expect_eq( controller.clamped_rate(), RateController::MIN_RATE, "sender rate never below one frame per second" );
}

void program_body()
{
  test_non_master_ignores_feedback();
  test_clr_selection();
  test_clr_cleared();
  test_clamp_floor();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "rate_controller: all tests passed\n";
  return EXIT_SUCCESS;
}
