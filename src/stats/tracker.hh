#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>

#include "recent_ring.hh"
#include "summarize.hh"

/* rolling receive statistics for one (remote peer, medium) stream */
class Tracker : public Summarizable
{
public:
  static constexpr uint64_t SEQUENCE_WINDOW = 3;
  static constexpr unsigned int STRIKES_TO_LOSS = 2;
  static constexpr double FLUSH_INTERVAL_S = 0.5;
  static constexpr double RATE_CONSTANT = 2.0;

  struct Snapshot
  {
    double latency_s, framerate, bitrate, framedrop;
    uint64_t received, lost, pending;
    uint64_t rejected_window, rejected_replay;
  };

private:
  /* expected sequence; trails the stream by the number of pending sequences */
  std::optional<uint64_t> pointer_ {};

  /* missing sequence -> strikes */
  std::map<uint64_t, unsigned int> pending_ {};

  RecentRing<uint64_t, SEQUENCE_WINDOW> recently_arrived_ {};
  RecentRing<uint64_t, SEQUENCE_WINDOW> recent_nonces_ {};

  double latency_s_ {};
  double last_latency_update_s_ {};

  double framerate_ {}, bitrate_ {}, framedrop_ {};
  bool have_rates_ {};
  double last_flush_s_ {};
  uint64_t interval_units_ {}, interval_bytes_ {}, interval_lost_ {};

  uint64_t received_ {}, lost_ {};
  uint64_t rejected_window_ {}, rejected_replay_ {};

  void update_latency( const double sample_s, const double now_s );
  void update_framedrop( const uint64_t sequence );
  void flush_rates( const double now_s );

public:
  /* replay and staleness defense; records the nonce of an accepted unit */
  bool check_integrity( const uint64_t sequence, const uint64_t packet_nonce );

  /* timestamps are sender wall-clock seconds, `now_s` the local wall clock */
  void update( const uint64_t sequence, const double timestamp_s, const size_t bytes, const double now_s );

  /* units per second the sender should aim for, once latency is known */
  std::optional<unsigned int> optimal_sending_rate() const;

  std::optional<uint64_t> pointer() const { return pointer_; }
  bool is_pending( const uint64_t sequence ) const { return pending_.count( sequence ); }

  Snapshot snapshot() const;

  void summary( std::ostream& out ) const override;
};
