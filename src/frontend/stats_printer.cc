#include "stats_printer.hh"
#include "exception.hh"

#include <cstdlib>
#include <iomanip>
#include <unistd.h>

using namespace std;
using namespace std::chrono;

StatsPrinterTask::StatsPrinterTask( shared_ptr<EventLoop> loop,
                                    const string& title,
                                    const milliseconds print_interval )
  : loop_( loop )
  , title_( title )
  , standard_error_( CheckSystemCall( "dup STDERR_FILENO", dup( STDERR_FILENO ) ) )
  , start_time_( steady_clock::now() )
  , print_interval_( print_interval )
  , next_stats_print( start_time_ )
  , next_stats_reset( start_time_ + stats_reset_interval )
{
  loop_->add_rule(
    "generate statistics", [&] { generate_report(); }, [&] { return steady_clock::now() > next_stats_print; } );

  loop_->add_rule(
    "print statistics",
    standard_error_,
    Direction::Out,
    [&] { pending_output_.erase( 0, standard_error_.write( pending_output_ ) ); },
    [&] { return not pending_output_.empty(); } );
}

unique_ptr<StatsPrinterTask> StatsPrinterTask::from_environment( shared_ptr<EventLoop> loop, const string& title )
{
  const char* setting = getenv( "PYPE_STATS" );
  if ( not setting ) {
    return nullptr;
  }

  /* anything that is not a plausible period (e.g. PYPE_STATS=1) means the default */
  const unsigned long interval_ms = strtoul( setting, nullptr, 10 );
  if ( interval_ms < 100 ) {
    return make_unique<StatsPrinterTask>( loop, title );
  }

  return make_unique<StatsPrinterTask>( loop, title, milliseconds( interval_ms ) );
}

void StatsPrinterTask::generate_report()
{
  ss_.str( {} );
  ss_.clear();

  const auto now = steady_clock::now();
  const double uptime = duration_cast<milliseconds>( now - start_time_ ).count() / 1000.0;

  ss_ << "==== " << title_ << " @ " << fixed << setprecision( 1 ) << uptime << " s";
  if ( reports_dropped_ ) {
    ss_ << " (reports dropped: " << reports_dropped_ << "!)";
  }
  ss_ << defaultfloat << setprecision( 6 ) << "\n";

  for ( const auto& obj : objects_ ) {
    if ( obj ) {
      obj->summary( ss_ );
      obj->reset_summary();
    }
  }

  loop_->summary( ss_ );
  ss_ << "\n";

  next_stats_print = now + print_interval_;

  /* rule counters restart periodically so the report shows recent behavior */
  if ( now > next_stats_reset ) {
    loop_->reset_summary();
    next_stats_reset = now + stats_reset_interval;
  }

  /* a stalled stderr keeps the older reports, newer ones are dropped */
  const auto str = ss_.str();
  if ( pending_output_.size() + str.size() <= max_pending_output ) {
    pending_output_.append( str );
  } else {
    reports_dropped_++;
  }
}

unsigned int StatsPrinterTask::wait_time_ms() const
{
  const auto now = steady_clock::now();
  if ( now > next_stats_print ) {
    return 0;
  } else {
    return duration_cast<milliseconds>( next_stats_print - now ).count();
  }
}
