#include "tracker.hh"
#include "ewma.hh"

#include <cmath>
#include <iomanip>

using namespace std;

bool Tracker::check_integrity( const uint64_t sequence, const uint64_t packet_nonce )
{
  if ( pointer_.has_value() and sequence + SEQUENCE_WINDOW < pointer_.value() ) {
    rejected_window_++;
    return false;
  }

  if ( recent_nonces_.contains( packet_nonce ) ) {
    rejected_replay_++;
    return false;
  }

  recent_nonces_.push( packet_nonce );
  return true;
}

void Tracker::update( const uint64_t sequence, const double timestamp_s, const size_t bytes, const double now_s )
{
  if ( not pointer_.has_value() ) {
    pointer_ = sequence;
    last_flush_s_ = now_s;
  }

  update_latency( now_s - timestamp_s, now_s );
  update_framedrop( sequence );

  received_++;
  interval_units_++;
  interval_bytes_ += bytes;

  flush_rates( now_s );
}

void Tracker::update_latency( const double sample_s, const double now_s )
{
  if ( latency_s_ == 0 ) {
    latency_s_ = sample_s;
  } else {
    ewma_update( latency_s_, sample_s, exp_weight( now_s - last_latency_update_s_ ) );
  }

  last_latency_update_s_ = now_s;
}

void Tracker::update_framedrop( const uint64_t sequence )
{
  uint64_t& pointer = pointer_.value();

  /* newly noticed gaps enter the ledger without a strike */
  const uint64_t first_fresh = pending_.empty() ? 0 : pending_.rbegin()->first + 1;
  for ( uint64_t missing = pointer; missing < sequence; missing++ ) {
    if ( not pending_.count( missing ) and not recently_arrived_.contains( missing ) ) {
      pending_.emplace( missing, 0 );
    }
  }

  pending_.erase( sequence );
  recently_arrived_.push( sequence );

  for ( auto it = pending_.begin(); it != pending_.end() and it->first < first_fresh; ) {
    if ( ++it->second >= STRIKES_TO_LOSS ) {
      it = pending_.erase( it );
      lost_++;
      interval_lost_++;
      pointer++;
    } else {
      ++it;
    }
  }

  pointer++;
}

void Tracker::flush_rates( const double now_s )
{
  const double elapsed = now_s - last_flush_s_;
  if ( elapsed < FLUSH_INTERVAL_S ) {
    return;
  }

  const double framerate = interval_units_ / elapsed;
  const double bitrate = 8.0 * interval_bytes_ / elapsed;
  const double framedrop = double( interval_lost_ ) / double( interval_lost_ + interval_units_ );

  if ( not have_rates_ ) {
    framerate_ = framerate;
    bitrate_ = bitrate;
    framedrop_ = framedrop;
    have_rates_ = true;
  } else {
    const double weight = exp_weight( elapsed );
    ewma_update( framerate_, framerate, weight );
    ewma_update( bitrate_, bitrate, weight );
    ewma_update( framedrop_, framedrop, weight );
  }

  interval_units_ = interval_bytes_ = interval_lost_ = 0;
  last_flush_s_ = now_s;
}

optional<unsigned int> Tracker::optimal_sending_rate() const
{
  if ( latency_s_ == 0 ) {
    return nullopt;
  }

  return static_cast<unsigned int>( lround( RATE_CONSTANT / fabs( latency_s_ ) ) );
}

Tracker::Snapshot Tracker::snapshot() const
{
  return { latency_s_, framerate_, bitrate_, framedrop_, received_, lost_, pending_.size(), rejected_window_,
           rejected_replay_ };
}

void Tracker::summary( ostream& out ) const
{
  out << fixed << setprecision( 1 ) << "latency=" << 1000 * latency_s_ << "ms";
  out << " fps=" << framerate_;
  out << " kbps=" << bitrate_ / 1000;
  out << " drop=" << setprecision( 1 ) << 100 * framedrop_ << "%";
  out << " recv=" << received_;

  if ( lost_ ) {
    out << " lost=" << lost_;
  }

  if ( rejected_window_ ) {
    out << " stale=" << rejected_window_ << "!";
  }

  if ( rejected_replay_ ) {
    out << " replayed=" << rejected_replay_ << "!";
  }
}
