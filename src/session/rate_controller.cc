#include "rate_controller.hh"

#include <algorithm>
#include <iostream>

using namespace std;

bool RateController::on_feedback( const Feedback& feedback, const bool is_master )
{
  if ( not is_master ) {
    ignored_++;
    return false;
  }

  const double current = rate_.load();
  const double proposed = feedback.rate;

  if ( not clr_.has_value() or ( clr_.value() != feedback.source and proposed < clr_rate_ ) ) {
    if ( clr_ != feedback.source ) {
      cerr << "Rate controller: CLR is now " << feedback.source << "\n";
    }
    clr_ = feedback.source;
  } else if ( clr_.value() != feedback.source ) {
    ignored_++;
    return false;
  }

  clr_rate_ = proposed;
  rate_.store( CURRENT_WEIGHT * current + PROPOSED_WEIGHT * proposed );
  adopted_++;
  return true;
}

void RateController::on_participant_left( const string& name )
{
  if ( clr_ == name ) {
    clr_.reset();
  }
}

void RateController::on_master_changed()
{
  clr_.reset();
}

double RateController::clamped_rate() const
{
  return clamp( rate_.load(), MIN_RATE, MAX_RATE );
}
