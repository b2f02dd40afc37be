#include "eventloop.hh"
#include "exception.hh"
#include "timer.hh"

#include <algorithm>
#include <iomanip>

using namespace std;

EventLoop::BasicRule::BasicRule( const size_t s_category_id, const InterestT& s_interest, const CallbackT& s_callback )
  : category_id( s_category_id )
  , interest( s_interest )
  , callback( s_callback )
{}

EventLoop::FDRule::FDRule( BasicRule&& base,
                           FileDescriptor&& s_fd,
                           const Direction s_direction,
                           const CallbackT& s_cancel,
                           const InterestT& s_recover )
  : BasicRule( move( base ) )
  , fd( move( s_fd ) )
  , direction( s_direction )
  , cancel( s_cancel )
  , recover( s_recover )
{}

size_t EventLoop::add_category( const string& name )
{
  if ( rule_categories_.size() >= 65536 ) {
    throw runtime_error( "maximum categories reached" );
  }

  rule_categories_.push_back( { name } );
  return rule_categories_.size() - 1;
}

void EventLoop::RuleHandle::cancel()
{
  const shared_ptr<BasicRule> rule_shared_ptr = rule_weak_ptr_.lock();
  if ( rule_shared_ptr ) {
    rule_shared_ptr->cancel_requested = true;
  }
}

EventLoop::RuleHandle EventLoop::add_rule( const size_t category_id,
                                           FileDescriptor& fd,
                                           const Direction direction,
                                           const CallbackT& callback,
                                           const InterestT& interest,
                                           const CallbackT& cancel,
                                           const InterestT& recover )
{
  if ( category_id >= rule_categories_.size() ) {
    throw out_of_range( "bad category_id" );
  }

  fd_rules_.emplace_back( make_shared<FDRule>(
    BasicRule { category_id, interest, callback }, fd.duplicate(), direction, cancel, recover ) );

  return fd_rules_.back();
}

EventLoop::RuleHandle EventLoop::add_rule( const size_t category_id,
                                           const CallbackT& callback,
                                           const InterestT& interest )
{
  if ( category_id >= rule_categories_.size() ) {
    throw out_of_range( "bad category_id" );
  }

  non_fd_rules_.emplace_back( make_shared<BasicRule>( category_id, interest, callback ) );

  return non_fd_rules_.back();
}

void EventLoop::run_timed( BasicRule& rule )
{
  const uint64_t start = Timer::timestamp_ns();
  rule.callback();
  const uint64_t elapsed = Timer::timestamp_ns() - start;

  auto& category = rule_categories_.at( rule.category_id );
  category.count++;
  category.total_ns += elapsed;
  category.max_ns = max( category.max_ns, elapsed );
}

EventLoop::Result EventLoop::wait_next_event( const int timeout_ms )
{
  /* first, handle the non-file-descriptor-related rules */
  for ( auto it = non_fd_rules_.begin(); it != non_fd_rules_.end(); ) {
    const auto this_rule = *it;

    if ( this_rule->cancel_requested ) {
      it = non_fd_rules_.erase( it );
      continue;
    }

    if ( this_rule->interest() ) {
      run_timed( *this_rule );
    }

    ++it;
  }

  /* now the file-descriptor-related rules */
  vector<pollfd> pollfds {};
  pollfds.reserve( fd_rules_.size() );

  for ( auto it = fd_rules_.begin(); it != fd_rules_.end(); ) {
    auto& this_rule = **it;

    if ( this_rule.cancel_requested ) {
      it = fd_rules_.erase( it );
      continue;
    }

    /* a closed descriptor, or one that reached EOF, can never be serviced again */
    if ( this_rule.fd.closed() or ( this_rule.direction == Direction::In and this_rule.fd.eof() ) ) {
      this_rule.cancel();
      it = fd_rules_.erase( it );
      continue;
    }

    pollfds.push_back( { this_rule.fd.fd_num(), this_rule.interest() ? short( this_rule.direction ) : short( 0 ), 0 } );
    ++it;
  }

  if ( pollfds.empty() and non_fd_rules_.empty() ) {
    return Result::Exit;
  }

  const int poll_ret = ::poll( pollfds.data(), pollfds.size(), timeout_ms );
  if ( poll_ret < 0 ) {
    if ( errno == EINTR ) {
      return Result::Timeout;
    }
    throw unix_error { "poll" };
  }

  if ( poll_ret == 0 ) {
    return Result::Timeout;
  }

  /* rules added by callbacks land after the polled prefix of the list */
  auto it = fd_rules_.begin();
  for ( size_t idx = 0; idx < pollfds.size(); ++idx, ++it ) {
    const auto this_rule = *it;
    const auto& this_pollfd = pollfds[idx];

    if ( this_rule->cancel_requested ) {
      continue;
    }

    if ( this_pollfd.revents & ( POLLERR | POLLNVAL ) ) {
      if ( not this_rule->recover() ) {
        this_rule->cancel();
        this_rule->cancel_requested = true;
      }
      continue;
    }

    const bool poll_ready = this_pollfd.revents & this_pollfd.events;
    const bool poll_hup = this_pollfd.revents & POLLHUP;

    if ( poll_hup and this_pollfd.events and ( this_rule->direction == Direction::Out or not poll_ready ) ) {
      this_rule->cancel();
      this_rule->cancel_requested = true;
      continue;
    }

    if ( poll_ready ) {
      run_timed( *this_rule );
    }
  }

  return Result::Success;
}

void EventLoop::summary( ostream& out ) const
{
  out << "Event loop rules:";
  for ( const auto& category : rule_categories_ ) {
    if ( category.count == 0 ) {
      continue;
    }
    out << " [" << category.name << "] n=" << category.count << " mean=" << fixed << setprecision( 1 )
        << category.total_ns / 1000.0 / category.count << "us max=" << category.max_ns / 1000.0 << "us";
  }
  out << "\n";
}

void EventLoop::reset_summary()
{
  for ( auto& category : rule_categories_ ) {
    category.count = category.total_ns = category.max_ns = 0;
  }
}
