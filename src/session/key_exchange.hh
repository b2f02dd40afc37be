#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "crypto.hh"
#include "eventloop.hh"
#include "json_stream.hh"
#include "messages.hh"
#include "socket.hh"

/* master side: hands the call's key material to anyone who presents an RSA public key, one connection each */
class KeyDistributor
{
  struct Connection
  {
    std::shared_ptr<TCPSocket> socket;
    JsonStreamDecoder decoder {};
    std::string outbound {};
    std::vector<EventLoop::RuleHandle> rules {};
  };

  EventLoop& loop_;
  SessionKeys keys_;
  TCPSocket listener_;
  std::optional<EventLoop::RuleHandle> listener_rule_ {};
  size_t receive_category_, send_category_;

  std::map<uint64_t, Connection> connections_ {};
  uint64_t next_connection_id_ { 1 };

  unsigned int served_ {}, refused_ {};

  void accept_connection();
  void receive( const uint64_t id );
  void send( const uint64_t id );
  void close_connection( const uint64_t id );

public:
  KeyDistributor( EventLoop& loop, const SessionKeys& keys, const Address& listen_address );
  ~KeyDistributor();

  uint16_t port() const { return listener_.local_address().port(); }

  unsigned int served() const { return served_; }
  unsigned int refused() const { return refused_; }

  /* nullopt if the public key is unusable */
  static std::optional<KeyInfo> seal_keys( const SessionKeys& keys, const std::string& public_key_pem );

  KeyDistributor( const KeyDistributor& other ) = delete;
  KeyDistributor& operator=( const KeyDistributor& other ) = delete;
};

/* peer side: one handshake against the master's distributor */
class KeyRequester
{
public:
  using Callback = std::function<void( const SessionKeys& )>;

  enum class State : uint8_t
  {
    Waiting,
    Done,
    Failed
  };

  static constexpr uint64_t TIMEOUT_NS = 5'000'000'000;

private:
  KeyPair keypair_ {};
  std::shared_ptr<TCPSocket> socket_;
  std::string outbound_ {};
  JsonStreamDecoder decoder_ {};
  Callback on_keys_;

  State state_ { State::Waiting };
  bool connected_ {};
  uint64_t deadline_ns_;
  std::vector<EventLoop::RuleHandle> rules_ {};

  void receive();
  void send();
  void finish( const State state );

public:
  /* starts a non-blocking connect; TIMEOUT_NS covers connect and reply alike.
     the callback runs on the loop and must not destroy the requester */
  KeyRequester( EventLoop& loop, const Address& distributor, const std::string& self, const Callback& on_keys );
  ~KeyRequester();

  State state() const { return state_; }
  bool finished() const { return state_ != State::Waiting; }
  bool timed_out() const;

  /* inverse of KeyDistributor::seal_keys */
  static bool unseal_keys( const KeyPair& keypair, const KeyInfo& info, SessionKeys& keys );

  KeyRequester( const KeyRequester& other ) = delete;
  KeyRequester& operator=( const KeyRequester& other ) = delete;
};
