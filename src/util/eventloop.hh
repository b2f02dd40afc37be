#pragma once

#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <poll.h>

#include "file_descriptor.hh"
#include "summarize.hh"

enum class Direction : short
{
  In = POLLIN,
  Out = POLLOUT
};

/* readiness-multiplexed dispatcher: every wait polls the watched descriptors once and services what is ready */
class EventLoop : public Summarizable
{
public:
  enum class Result
  {
    Success,
    Timeout,
    Exit
  };

  using CallbackT = std::function<void( void )>;
  using InterestT = std::function<bool( void )>;

private:
  struct RuleCategory
  {
    std::string name;
    uint64_t count {}, total_ns {}, max_ns {};
  };

  struct BasicRule
  {
    size_t category_id;
    InterestT interest;
    CallbackT callback;
    bool cancel_requested {};

    BasicRule( const size_t s_category_id, const InterestT& s_interest, const CallbackT& s_callback );
  };

  struct FDRule : public BasicRule
  {
    FileDescriptor fd;
    Direction direction;
    CallbackT cancel;
    InterestT recover;

    FDRule( BasicRule&& base,
            FileDescriptor&& s_fd,
            const Direction s_direction,
            const CallbackT& s_cancel,
            const InterestT& s_recover );
  };

  std::vector<RuleCategory> rule_categories_ {};
  std::list<std::shared_ptr<FDRule>> fd_rules_ {};
  std::list<std::shared_ptr<BasicRule>> non_fd_rules_ {};

  void run_timed( BasicRule& rule );

public:
  EventLoop() {}

  size_t add_category( const std::string& name );

  class RuleHandle
  {
    std::weak_ptr<BasicRule> rule_weak_ptr_;

  public:
    template<class RuleType>
    RuleHandle( const std::shared_ptr<RuleType> x )
      : rule_weak_ptr_( x )
    {}

    void cancel();
  };

  RuleHandle add_rule(
    const size_t category_id,
    FileDescriptor& fd,
    const Direction direction,
    const CallbackT& callback,
    const InterestT& interest = [] { return true; },
    const CallbackT& cancel = [] {},
    const InterestT& recover = [] { return false; } );

  RuleHandle add_rule(
    const size_t category_id,
    const CallbackT& callback,
    const InterestT& interest = [] { return true; } );

  template<typename... Targs>
  RuleHandle add_rule( const std::string& name, Targs&&... Fargs )
  {
    return add_rule( add_category( name ), std::forward<Targs>( Fargs )... );
  }

  /* timeout_ms < 0 blocks until some watched descriptor is ready */
  Result wait_next_event( const int timeout_ms );

  void summary( std::ostream& out ) const override;
  void reset_summary() override;
};
