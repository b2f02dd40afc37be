#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "directory.hh"
#include "eventloop.hh"
#include "json_stream.hh"
#include "key_exchange.hh"
#include "messages.hh"
#include "presentation.hh"
#include "session.hh"
#include "socket.hh"
#include "summarize.hh"
#include "task_queue.hh"

/* the client: control stream to the directory server, local UI ingress, and the current call */
class Peer : public Summarizable
{
  static constexpr uint64_t FEEDBACK_INTERVAL_NS = 1'000'000'000;
  static constexpr uint64_t STATE_INTERVAL_NS = 1'000'000'000;
  static constexpr uint64_t STATISTICS_INTERVAL_NS = 1'000'000'000;

  EventLoop& loop_;
  Presentation& presentation_;
  MediaDevices devices_;
  Session::Ports ports_;

  std::shared_ptr<TCPSocket> server_;
  JsonStreamDecoder server_decoder_ {};
  bool server_closed_ {};

  UDPSocket ingress_ {};

  TaskQueue tasks_;
  DirectoryMirror directory_ {};

  std::unique_ptr<Session> session_ {};
  std::vector<EventLoop::RuleHandle> session_rules_ {};
  size_t chat_category_, control_category_;
  std::unique_ptr<KeyDistributor> distributor_ {};
  std::unique_ptr<KeyRequester> requester_ {};

  /* media flags the other participants announce */
  std::map<std::string, StateAnnounce> remote_state_ {};

  uint64_t next_feedback_ns_ {}, next_state_ns_ {}, next_statistics_ns_ {};

  struct Statistics
  {
    unsigned int malformed, ignored, key_exchange_failures;
  } stats_ {};

  void send_to_server( const Message& message );

  void receive_from_server();
  void handle_server( const Message& message );
  void handle_ui( const Message& message );
  void handle_control( const Address& source, const Message& message );

  void start_session( const CallInfo& call );
  void update_session( const CallInfo& call );
  void end_session();
  void become_master();
  void request_keys( const Address& distributor );

  void receive_chat();
  void receive_control();
  void call_maintenance();

public:
  Peer( EventLoop& loop,
        const Address& server,
        Presentation& presentation,
        const MediaDevices& devices,
        const Session::Ports& ports,
        const uint64_t task_ttl_ms );

  ~Peer();

  /* where pype-control sends UI events */
  Address ingress_address() const { return ingress_.local_address(); }

  /* presentation-originated events, delivered locally or through the ingress socket */
  void handle_ui_event( const Message& message ) { handle_ui( message ); }

  bool server_closed() const { return server_closed_; }
  const DirectoryMirror& directory() const { return directory_; }
  const Session* session() const { return session_.get(); }

  void summary( std::ostream& out ) const override;

  Peer( const Peer& other ) = delete;
  Peer& operator=( const Peer& other ) = delete;
};
