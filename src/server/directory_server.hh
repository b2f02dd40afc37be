#pragma once

#include <map>
#include <memory>
#include <ostream>
#include <string>

#include "eventloop.hh"
#include "json_stream.hh"
#include "registry.hh"
#include "socket.hh"
#include "summarize.hh"
#include "task_queue.hh"

/* accepts client control streams and feeds their messages to the registry */
class DirectoryServer : public Summarizable
{
  struct Connection
  {
    std::shared_ptr<TCPSocket> socket;
    JsonStreamDecoder decoder {};
  };

  /* delivers registry notifications through the task queue */
  class Context : public RegistryContext
  {
    DirectoryServer& server_;

  public:
    explicit Context( DirectoryServer& server )
      : server_( server )
    {}

    void send_to( const ConnectionId conn, const Message& message ) override;
  };

  EventLoop& loop_;
  TCPSocket listener_;

  Registry registry_ {};
  TaskQueue tasks_;
  Context context_ { *this };

  std::map<ConnectionId, Connection> connections_ {};
  ConnectionId next_connection_id_ { 1 };

  size_t receive_category_, accept_category_;

  struct Statistics
  {
    unsigned int accepted, closed, malformed;
  } stats_ {};

  void accept_connection();
  void receive( const ConnectionId id );
  void close_connection( const ConnectionId id );

public:
  DirectoryServer( EventLoop& loop, const Address& listen_address, const uint64_t task_ttl_ms );

  Address local_address() const { return listener_.local_address(); }

  const Registry& registry() const { return registry_; }
  const TaskQueue& tasks() const { return tasks_; }
  size_t connection_count() const { return connections_.size(); }

  void summary( std::ostream& out ) const override;
};
