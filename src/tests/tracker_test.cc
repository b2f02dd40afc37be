#include <cstdlib>
#include <iostream>

#include "test_util.hh"
#include "tracker.hh"

using namespace std;

void test_replay_defense()
{
  Tracker tracker;

  expect( tracker.check_integrity( 0, 100 ), "first unit accepted" );
  tracker.update( 0, 1.0, 10, 1.01 );

  expect( not tracker.check_integrity( 1, 100 ), "repeated nonce rejected" );
  expect_eq( tracker.snapshot().rejected_replay, 1u, "replay counted" );

  for ( uint64_t i = 1; i <= 3; i++ ) {
    expect( tracker.check_integrity( i, 100 + i ), "fresh nonce accepted" );
    tracker.update( i, 1.0 + i * 0.02, 10, 1.01 + i * 0.02 );
  }

  /* only the last three nonces are remembered */
  expect( tracker.check_integrity( 4, 100 ), "evicted nonce accepted again" );
  expect( not tracker.check_integrity( 5, 103 ), "recent nonce still rejected" );
}

void test_sequence_window()
{
  Tracker tracker;

  for ( uint64_t i = 0; i < 10; i++ ) {
    expect( tracker.check_integrity( i, 1000 + i ), "in-order unit accepted" );
    tracker.update( i, 1.0, 10, 1.05 );
  }
  expect_eq( tracker.pointer().value(), 10u, "pointer after ten in-order units" );

  expect( not tracker.check_integrity( 6, 1 ), "unit trailing by four rejected" );
  expect_eq( tracker.snapshot().rejected_window, 1u, "stale unit counted" );
  expect( tracker.check_integrity( 7, 2 ), "unit trailing by three accepted" );
}

void test_reordering()
{
  Tracker tracker;

  tracker.update( 0, 1.0, 10, 1.05 );
  tracker.update( 2, 1.0, 10, 1.05 );
  expect( tracker.is_pending( 1 ), "gap enters the ledger" );

  tracker.update( 1, 1.0, 10, 1.05 );
  expect( not tracker.is_pending( 1 ), "late arrival leaves the ledger" );
  expect_eq( tracker.snapshot().lost, 0u, "reordering is not loss" );
  expect_eq( tracker.pointer().value(), 3u, "pointer after reordered units" );

  /* a replayed nonce is still caught after reordering */
  Tracker other;
  expect( other.check_integrity( 5, 7 ), "first" );
  other.update( 5, 1.0, 10, 1.05 );
  expect( other.check_integrity( 4, 8 ), "reordered unit" );
  other.update( 4, 1.0, 10, 1.05 );
  expect( not other.check_integrity( 6, 7 ), "replay after reordering" );
}

void test_loss_after_two_strikes()
{
  Tracker tracker;

  tracker.update( 0, 1.0, 10, 1.05 );
  tracker.update( 2, 1.0, 10, 1.05 );
  tracker.update( 3, 1.0, 10, 1.05 );
  expect( tracker.is_pending( 1 ), "one strike is not yet loss" );
  expect_eq( tracker.snapshot().lost, 0u, "nothing lost after one strike" );

  tracker.update( 4, 1.0, 10, 1.05 );
  expect( not tracker.is_pending( 1 ), "declared lost after two strikes" );
  expect_eq( tracker.snapshot().lost, 1u, "loss counted" );
  expect_eq( tracker.pointer().value(), 5u, "pointer advanced past the loss" );
}

void test_framedrop_convergence()
{
  Tracker tracker;

  /* one of every four units goes missing */
  const double step = 0.02;
  for ( uint64_t i = 0; i < 2000; i++ ) {
    if ( i % 4 == 3 ) {
      continue;
    }
    const double now = 100.0 + i * step;
    tracker.update( i, now - 0.05, 200, now );
  }

  const auto snapshot = tracker.snapshot();
  expect_near( snapshot.framedrop, 0.25, 0.06, "framedrop converges to the loss ratio" );
  expect_near( snapshot.framerate, 37.5, 3.0, "framerate counts delivered units" );
  expect_near( snapshot.bitrate, 37.5 * 200 * 8, 5000, "bitrate in bits per second" );
  expect_near( snapshot.latency_s, 0.05, 1e-6, "constant latency" );
}

void test_optimal_sending_rate()
{
  Tracker tracker;
  expect( not tracker.optimal_sending_rate().has_value(), "no rate before any latency sample" );

  tracker.update( 0, 10.0, 100, 10.05 );
  expect_eq( tracker.optimal_sending_rate().value(), 40u, "first latency sample adopted" );

  /* later samples are blended, weighted by elapsed time */
  tracker.update( 1, 10.9, 100, 11.05 );
  const double weight = 1.0 - exp( -1.0 );
  expect_near( tracker.snapshot().latency_s, weight * 0.15 + ( 1 - weight ) * 0.05, 1e-9, "latency EWMA" );
}

void program_body()
{
  test_replay_defense();
  test_sequence_window();
  test_reordering();
  test_loss_after_two_strikes();
  test_framedrop_convergence();
  test_optimal_sending_rate();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "tracker: all tests passed\n";
  return EXIT_SUCCESS;
}
