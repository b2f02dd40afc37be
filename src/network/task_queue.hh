#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "address.hh"
#include "eventloop.hh"
#include "file_descriptor.hh"
#include "socket.hh"
#include "summarize.hh"

/* outbound messages waiting for their destination to become writable; pushed from any thread, sent by the loop */
class TaskQueue : public Summarizable
{
public:
  struct Task
  {
    std::shared_ptr<TCPSocket> stream {};
    std::shared_ptr<UDPSocket> datagram {};
    std::optional<Address> destination {};

    std::string payload {};
    size_t bytes_sent {};
    uint64_t enqueued_ns {};

    int fd_num() const { return stream ? stream->fd_num() : datagram->fd_num(); }
  };

  struct Statistics
  {
    unsigned int pushed, sent, expired, forgotten, send_failures;
  };

private:
  mutable std::mutex mutex_ {};
  std::deque<Task> tasks_ {};
  Statistics stats_ {};

  uint64_t ttl_ns_;
  std::map<int, uint64_t> backoff_until_ns_ {}; /* per destination fd */
  uint64_t next_expiry_ns_ {};
  std::optional<size_t> send_category_ {};

  WakeupPipe wakeup_ {};

  void push( Task&& task );
  void expire_stale( const uint64_t now );

public:
  static constexpr uint64_t DEFAULT_TTL_MS = 30'000;
  static constexpr uint64_t SEND_FAILURE_BACKOFF_NS = 50'000'000;
  static constexpr uint64_t EXPIRY_INTERVAL_NS = 1'000'000'000;

  explicit TaskQueue( const uint64_t ttl_ms = DEFAULT_TTL_MS );

  /* reads PYPE_TASK_TTL_MS */
  static uint64_t ttl_from_environment();

  void push( std::shared_ptr<TCPSocket> stream, std::string payload );
  void push( std::shared_ptr<UDPSocket> socket, const Address& destination, std::string payload );

  bool has_pending( const int fd_num ) const;

  /* send (in order) whatever this destination accepts without blocking */
  void send_pending( const int fd_num );

  /* the destination was closed; its tasks are dropped */
  void forget( const int fd_num );

  /* drop tasks older than the TTL */
  void expire();

  size_t size() const;

  /* wakes the loop on push, and sends to `destination` when it is writable */
  void install( EventLoop& loop );
  EventLoop::RuleHandle watch( EventLoop& loop, FileDescriptor& destination );

  Statistics statistics() const;

  void summary( std::ostream& out ) const override;
};
