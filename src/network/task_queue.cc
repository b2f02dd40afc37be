#include "task_queue.hh"
#include "exception.hh"
#include "timer.hh"

#include <cstdlib>
#include <iostream>

using namespace std;

TaskQueue::TaskQueue( const uint64_t ttl_ms )
  : ttl_ns_( ttl_ms * 1'000'000 )
{}

uint64_t TaskQueue::ttl_from_environment()
{
  const char* ttl = getenv( "PYPE_TASK_TTL_MS" );
  if ( not ttl ) {
    return DEFAULT_TTL_MS;
  }

  const uint64_t value = strtoull( ttl, nullptr, 10 );
  return value ? value : DEFAULT_TTL_MS;
}

void TaskQueue::push( Task&& task )
{
  task.enqueued_ns = Timer::timestamp_ns();

  {
    lock_guard<mutex> lock { mutex_ };
    tasks_.push_back( move( task ) );
    stats_.pushed++;
  }

  wakeup_.notify();
}

void TaskQueue::push( shared_ptr<TCPSocket> stream, string payload )
{
  if ( not stream ) {
    throw runtime_error( "TaskQueue::push: null stream" );
  }

  Task task;
  task.stream = move( stream );
  task.payload = move( payload );
  push( move( task ) );
}

void TaskQueue::push( shared_ptr<UDPSocket> socket, const Address& destination, string payload )
{
  if ( not socket ) {
    throw runtime_error( "TaskQueue::push: null socket" );
  }

  Task task;
  task.datagram = move( socket );
  task.destination = destination;
  task.payload = move( payload );
  push( move( task ) );
}

void TaskQueue::expire_stale( const uint64_t now )
{
  for ( auto it = tasks_.begin(); it != tasks_.end(); ) {
    if ( now - it->enqueued_ns > ttl_ns_ ) {
      it = tasks_.erase( it );
      stats_.expired++;
    } else {
      ++it;
    }
  }
}

bool TaskQueue::has_pending( const int fd_num ) const
{
  lock_guard<mutex> lock { mutex_ };

  const auto backoff = backoff_until_ns_.find( fd_num );
  if ( backoff != backoff_until_ns_.end() and Timer::timestamp_ns() < backoff->second ) {
    return false;
  }

  for ( const auto& task : tasks_ ) {
    if ( task.fd_num() == fd_num ) {
      return true;
    }
  }

  return false;
}

void TaskQueue::send_pending( const int fd_num )
{
  lock_guard<mutex> lock { mutex_ };

  const uint64_t now = Timer::timestamp_ns();
  expire_stale( now );

  for ( auto it = tasks_.begin(); it != tasks_.end(); ) {
    if ( it->fd_num() != fd_num ) {
      ++it;
      continue;
    }

    try {
      if ( it->stream ) {
        const string_view remaining = string_view( it->payload ).substr( it->bytes_sent );
        it->bytes_sent += it->stream->write( remaining );
        if ( it->bytes_sent < it->payload.size() ) {
          /* stream is full; keep order */
          return;
        }
      } else {
        it->datagram->sendto( it->destination.value(), it->payload );
      }
    } catch ( const unix_error& e ) {
      /* retried until the TTL runs out or the destination is forgotten */
      stats_.send_failures++;
      backoff_until_ns_[fd_num] = now + SEND_FAILURE_BACKOFF_NS;
      cerr << "TaskQueue: send to fd " << fd_num << " failed: " << e.what() << "\n";
      return;
    }

    it = tasks_.erase( it );
    stats_.sent++;
  }

  backoff_until_ns_.erase( fd_num );
}

void TaskQueue::forget( const int fd_num )
{
  lock_guard<mutex> lock { mutex_ };

  backoff_until_ns_.erase( fd_num );

  for ( auto it = tasks_.begin(); it != tasks_.end(); ) {
    if ( it->fd_num() == fd_num ) {
      it = tasks_.erase( it );
      stats_.forgotten++;
    } else {
      ++it;
    }
  }
}

size_t TaskQueue::size() const
{
  lock_guard<mutex> lock { mutex_ };
  return tasks_.size();
}

void TaskQueue::expire()
{
  lock_guard<mutex> lock { mutex_ };
  expire_stale( Timer::timestamp_ns() );
}

void TaskQueue::install( EventLoop& loop )
{
  send_category_ = loop.add_category( "task queue send" );

  loop.add_rule( "task queue wakeup", wakeup_.fd(), Direction::In, [&] { wakeup_.drain(); } );

  loop.add_rule(
    "task queue expiry",
    [&] {
      expire();
      next_expiry_ns_ = Timer::timestamp_ns() + EXPIRY_INTERVAL_NS;
    },
    [&] { return Timer::timestamp_ns() > next_expiry_ns_; } );
}

EventLoop::RuleHandle TaskQueue::watch( EventLoop& loop, FileDescriptor& destination )
{
  if ( not send_category_.has_value() ) {
    throw runtime_error( "TaskQueue::watch before install" );
  }

  const int fd_num = destination.fd_num();
  return loop.add_rule(
    send_category_.value(),
    destination,
    Direction::Out,
    [this, fd_num] { send_pending( fd_num ); },
    [this, fd_num] { return has_pending( fd_num ); },
    [this, fd_num] { forget( fd_num ); } );
}

TaskQueue::Statistics TaskQueue::statistics() const
{
  lock_guard<mutex> lock { mutex_ };
  return stats_;
}

void TaskQueue::summary( ostream& out ) const
{
  lock_guard<mutex> lock { mutex_ };

  out << "Task queue: pending=" << tasks_.size() << " sent=" << stats_.sent << "/" << stats_.pushed;

  if ( stats_.expired ) {
    out << " expired=" << stats_.expired << "!";
  }

  if ( stats_.forgotten ) {
    out << " dropped=" << stats_.forgotten;
  }

  if ( stats_.send_failures ) {
    out << " send_failures=" << stats_.send_failures << "!";
  }

  out << "\n";
}
