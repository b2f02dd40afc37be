#pragma once

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "eventloop.hh"
#include "file_descriptor.hh"

/* periodic status report on stderr: every registered summary, then the loop's rule counters */
class StatsPrinterTask
{
  std::shared_ptr<EventLoop> loop_;
  std::string title_;
  std::vector<std::shared_ptr<Summarizable>> objects_ {};

  FileDescriptor standard_error_;
  std::string pending_output_ {};
  unsigned int reports_dropped_ {};

  using time_point = decltype( std::chrono::steady_clock::now() );

  const time_point start_time_;
  const std::chrono::milliseconds print_interval_;
  time_point next_stats_print, next_stats_reset;

  static constexpr auto stats_reset_interval = std::chrono::seconds( 10 );
  static constexpr size_t max_pending_output = 65536;

  std::ostringstream ss_ {};

  void generate_report();

public:
  static constexpr auto default_print_interval = std::chrono::milliseconds( 500 );

  StatsPrinterTask( std::shared_ptr<EventLoop> loop,
                    const std::string& title,
                    const std::chrono::milliseconds print_interval = default_print_interval );

  /* PYPE_STATS unset: nullptr; "1" or other non-numeric: default interval; otherwise its value in ms */
  static std::unique_ptr<StatsPrinterTask> from_environment( std::shared_ptr<EventLoop> loop,
                                                             const std::string& title );

  unsigned int wait_time_ms() const;

  template<class T>
  void add( std::shared_ptr<T> obj )
  {
    objects_.push_back( std::static_pointer_cast<Summarizable>( obj ) );
  }
};
