#pragma once

#include <atomic>
#include <optional>
#include <string>

#include "messages.hh"

/* master-side video rate adaptation driven by the most constrained receiver (the CLR) */
class RateController
{
  std::optional<std::string> clr_ {};
  double clr_rate_ {}; /* last rate the CLR reported */
  std::atomic<double> rate_;

  unsigned int adopted_ {}, ignored_ {};

public:
  static constexpr double CURRENT_WEIGHT = 0.6;
  static constexpr double PROPOSED_WEIGHT = 0.4;
  static constexpr double INITIAL_RATE = 30.0;
  static constexpr double MIN_RATE = 1.0;
  static constexpr double MAX_RATE = 30.0;

  explicit RateController( const double initial_rate = INITIAL_RATE )
    : rate_( initial_rate )
  {}

  /* only the call master adapts; returns whether the report was adopted */
  bool on_feedback( const Feedback& feedback, const bool is_master );

  void on_participant_left( const std::string& name );
  void on_master_changed();

  /* frames per second, as the video sender should use it */
  double rate() const { return rate_.load(); }
  double clamped_rate() const;

  const std::optional<std::string>& clr() const { return clr_; }
  unsigned int adopted() const { return adopted_; }
  unsigned int ignored() const { return ignored_; }
};
