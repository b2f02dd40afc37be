#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "address_pool.hh"
#include "messages.hh"
#include "summarize.hh"

using ConnectionId = uint64_t;

/* how the registry reaches connected clients */
class RegistryContext
{
public:
  virtual void send_to( const ConnectionId conn, const Message& message ) = 0;
  virtual ~RegistryContext() = default;
};

/* directory of users and the calls they form; mutated only from the server's event loop */
class Registry : public Summarizable
{
  struct User
  {
    std::string name;
    ConnectionId conn;
    UserStatus status { UserStatus::Available };
    std::optional<uint64_t> call_id {};
  };

  struct Call
  {
    uint64_t id;
    std::string master;
    std::vector<std::string> participants; /* in joining order */
    CallAddresses addresses;

    CallInfo info() const { return { id, master, participants, addresses }; }
  };

  std::map<std::string, User> users_ {};
  std::map<uint64_t, Call> calls_ {};
  std::map<ConnectionId, std::string> names_ {};

  /* (caller, callee) */
  std::set<std::pair<std::string, std::string>> pending_invitations_ {};

  MulticastAddressPool pool_ {};
  uint64_t next_call_id_ { 1 };

  struct Statistics
  {
    unsigned int joins, rejected_joins, disconnects, calls_created, calls_dissolved, ignored;
  } stats_ {};

  User* user_by_conn( const ConnectionId conn );
  User* user_by_name( const std::string& name );

  void broadcast( RegistryContext& context, const Message& message, const std::string& except = {} );
  void set_status( RegistryContext& context, User& user, const UserStatus status );

  void add_to_call( RegistryContext& context, Call& call, User& user );
  void create_call( RegistryContext& context, User& caller, User& callee );
  void leave_call( RegistryContext& context, User& user );
  void clear_invitations( RegistryContext& context, const std::string& name );

public:
  /* false if the name is taken (the client is told either way) */
  bool join( RegistryContext& context, const ConnectionId conn, const std::string& name );

  void disconnect( RegistryContext& context, const ConnectionId conn );

  void call_request( RegistryContext& context, const ConnectionId caller_conn, const std::string& callee );
  void callee_response( RegistryContext& context, const ConnectionId callee_conn, const CalleeResponse& response );
  void leave( RegistryContext& context, const ConnectionId conn );

  /* routes an inbound client message; anything a client may not send is ignored */
  void handle( RegistryContext& context, const ConnectionId conn, const Message& message );

  size_t user_count() const { return users_.size(); }
  size_t call_count() const { return calls_.size(); }
  size_t pending_invitation_count() const { return pending_invitations_.size(); }

  std::optional<UserStatus> status_of( const std::string& name ) const;
  std::optional<CallInfo> call_of( const std::string& name ) const;
  std::vector<CallInfo> active_calls() const;
  const MulticastAddressPool& address_pool() const { return pool_; }

  void summary( std::ostream& out ) const override;
};
