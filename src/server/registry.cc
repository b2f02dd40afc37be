#include "registry.hh"

#include <algorithm>
#include <iostream>

using namespace std;

Registry::User* Registry::user_by_conn( const ConnectionId conn )
{
  const auto name = names_.find( conn );
  if ( name == names_.end() ) {
    return nullptr;
  }
  return &users_.at( name->second );
}

Registry::User* Registry::user_by_name( const string& name )
{
  const auto user = users_.find( name );
  return user == users_.end() ? nullptr : &user->second;
}

void Registry::broadcast( RegistryContext& context, const Message& message, const string& except )
{
  for ( const auto& [name, user] : users_ ) {
    if ( name != except ) {
      context.send_to( user.conn, message );
    }
  }
}

void Registry::set_status( RegistryContext& context, User& user, const UserStatus status )
{
  if ( user.status == status ) {
    return;
  }

  user.status = status;
  broadcast( context, UserUpdate { UserUpdate::Kind::Status, user.name, status }, user.name );
}

bool Registry::join( RegistryContext& context, const ConnectionId conn, const string& name )
{
  if ( name.empty() or users_.count( name ) or names_.count( conn ) ) {
    stats_.rejected_joins++;
    context.send_to( conn, JoinResponse { false, name, {}, {} } );
    return false;
  }

  JoinResponse response { true, name, {}, active_calls() };
  for ( const auto& [other_name, other] : users_ ) {
    response.users.push_back( { other_name, other.status } );
  }

  users_.emplace( name, User { name, conn } );
  names_.emplace( conn, name );
  stats_.joins++;

  context.send_to( conn, response );
  broadcast( context, UserUpdate { UserUpdate::Kind::Join, name, UserStatus::Available }, name );

  cerr << "User joined: " << name << "\n";
  return true;
}

void Registry::clear_invitations( RegistryContext& context, const string& name )
{
  for ( auto it = pending_invitations_.begin(); it != pending_invitations_.end(); ) {
    const auto [caller_name, callee_name] = *it;

    if ( caller_name == name ) {
      /* the prompted callee is free again */
      it = pending_invitations_.erase( it );
      User* callee = user_by_name( callee_name );
      if ( callee and not callee->call_id.has_value() ) {
        set_status( context, *callee, UserStatus::Available );
      }
    } else if ( callee_name == name ) {
      /* the waiting caller hears a rejection */
      it = pending_invitations_.erase( it );
      User* caller = user_by_name( caller_name );
      if ( caller ) {
        context.send_to( caller->conn, CalleeResponse { caller_name, callee_name, false } );
        if ( not caller->call_id.has_value() ) {
          set_status( context, *caller, UserStatus::Available );
        }
      }
    } else {
      ++it;
    }
  }
}

void Registry::disconnect( RegistryContext& context, const ConnectionId conn )
{
  User* user = user_by_conn( conn );
  if ( not user ) {
    return;
  }

  const string name = user->name;

  if ( user->call_id.has_value() ) {
    leave_call( context, *user );
  }

  clear_invitations( context, name );

  names_.erase( conn );
  users_.erase( name );
  stats_.disconnects++;

  broadcast( context, UserUpdate { UserUpdate::Kind::Leave, name, UserStatus::Available } );

  cerr << "User left: " << name << "\n";
}

void Registry::call_request( RegistryContext& context, const ConnectionId caller_conn, const string& callee_name )
{
  User* caller = user_by_conn( caller_conn );
  if ( not caller ) {
    stats_.ignored++;
    return;
  }

  User* callee = user_by_name( callee_name );
  if ( not callee or callee == caller or callee->status != UserStatus::Available ) {
    context.send_to( caller_conn, CallUnavailable { callee_name } );
    return;
  }

  set_status( context, *caller, UserStatus::InCall );
  set_status( context, *callee, UserStatus::InCall );

  pending_invitations_.emplace( caller->name, callee_name );
  context.send_to( callee->conn, CallParticipate { caller->name } );
}

void Registry::add_to_call( RegistryContext& context, Call& call, User& user )
{
  if ( find( call.participants.begin(), call.participants.end(), user.name ) == call.participants.end() ) {
    call.participants.push_back( user.name );
  }
  user.call_id = call.id;
  set_status( context, user, UserStatus::InCall );

  broadcast( context, CallUpdate { CallUpdate::Kind::UserJoin, call.master, user.name, call.info() } );
}

void Registry::create_call( RegistryContext& context, User& caller, User& callee )
{
  const uint64_t id = next_call_id_++;

  Call call { id, caller.name, { caller.name, callee.name }, {} };
  call.addresses.audio = pool_.allocate();
  call.addresses.video = pool_.allocate();
  call.addresses.chat = pool_.allocate();

  caller.call_id = id;
  callee.call_id = id;
  set_status( context, caller, UserStatus::InCall );
  set_status( context, callee, UserStatus::InCall );

  const auto& stored = calls_.emplace( id, move( call ) ).first->second;
  stats_.calls_created++;

  broadcast( context, CallUpdate { CallUpdate::Kind::CallAdd, stored.master, callee.name, stored.info() } );

  cerr << "Call " << id << " created: " << caller.name << " + " << callee.name << "\n";
}

void Registry::callee_response( RegistryContext& context,
                                const ConnectionId callee_conn,
                                const CalleeResponse& response )
{
  User* callee = user_by_conn( callee_conn );
  if ( not callee or callee->name != response.callee
       or not pending_invitations_.erase( { response.caller, response.callee } ) ) {
    stats_.ignored++;
    return;
  }

  User* caller = user_by_name( response.caller );
  if ( not caller ) {
    stats_.ignored++;
    return;
  }

  context.send_to( caller->conn, response );

  if ( not response.accept ) {
    for ( User* party : { caller, callee } ) {
      if ( not party->call_id.has_value() ) {
        set_status( context, *party, UserStatus::Available );
      }
    }
    return;
  }

  if ( caller->call_id.has_value() and callee->call_id != caller->call_id ) {
    if ( callee->call_id.has_value() ) {
      leave_call( context, *callee );
    }
    add_to_call( context, calls_.at( caller->call_id.value() ), *callee );
  } else if ( callee->call_id.has_value() and not caller->call_id.has_value() ) {
    add_to_call( context, calls_.at( callee->call_id.value() ), *caller );
  } else if ( not caller->call_id.has_value() ) {
    create_call( context, *caller, *callee );
  }
}

void Registry::leave_call( RegistryContext& context, User& user )
{
  const auto call_it = calls_.find( user.call_id.value() );
  user.call_id.reset();

  if ( call_it == calls_.end() ) {
    set_status( context, user, UserStatus::Available );
    return;
  }

  Call& call = call_it->second;
  call.participants.erase( remove( call.participants.begin(), call.participants.end(), user.name ),
                           call.participants.end() );

  if ( call.master == user.name and not call.participants.empty() ) {
    call.master = call.participants.front();
  }

  set_status( context, user, UserStatus::Available );

  if ( call.participants.size() <= 1 ) {
    const CallInfo info = call.info();

    pool_.release( call.addresses.audio );
    pool_.release( call.addresses.video );
    pool_.release( call.addresses.chat );

    for ( const auto& name : call.participants ) {
      User* last = user_by_name( name );
      if ( last ) {
        last->call_id.reset();
        set_status( context, *last, UserStatus::Available );
      }
    }

    calls_.erase( call_it );
    stats_.calls_dissolved++;

    broadcast( context, CallUpdate { CallUpdate::Kind::CallRemove, info.master, user.name, info } );

    cerr << "Call " << info.id << " dissolved\n";
    return;
  }

  broadcast( context, CallUpdate { CallUpdate::Kind::UserLeave, call.master, user.name, call.info() } );
}

void Registry::leave( RegistryContext& context, const ConnectionId conn )
{
  User* user = user_by_conn( conn );
  if ( not user or not user->call_id.has_value() ) {
    stats_.ignored++;
    return;
  }

  leave_call( context, *user );
}

void Registry::handle( RegistryContext& context, const ConnectionId conn, const Message& message )
{
  visit( overloaded {
           [&]( const JoinRequest& m ) { join( context, conn, m.name ); },
           [&]( const CallRequest& m ) { call_request( context, conn, m.callee ); },
           [&]( const CalleeResponse& m ) { callee_response( context, conn, m ); },
           [&]( const SessionLeave& ) { leave( context, conn ); },
           [&]( const auto& ) { stats_.ignored++; },
         },
         message );
}

optional<UserStatus> Registry::status_of( const string& name ) const
{
  const auto user = users_.find( name );
  if ( user == users_.end() ) {
    return nullopt;
  }
  return user->second.status;
}

optional<CallInfo> Registry::call_of( const string& name ) const
{
  const auto user = users_.find( name );
  if ( user == users_.end() or not user->second.call_id.has_value() ) {
    return nullopt;
  }
  return calls_.at( user->second.call_id.value() ).info();
}

vector<CallInfo> Registry::active_calls() const
{
  vector<CallInfo> ret;
  for ( const auto& [id, call] : calls_ ) {
    ret.push_back( call.info() );
  }
  return ret;
}

void Registry::summary( ostream& out ) const
{
  out << "Directory: users=" << users_.size() << " calls=" << calls_.size()
      << " multicast_groups=" << pool_.in_use();

  if ( not pending_invitations_.empty() ) {
    out << " ringing=" << pending_invitations_.size();
  }

  out << " joins=" << stats_.joins << " calls_created=" << stats_.calls_created;

  if ( stats_.rejected_joins ) {
    out << " rejected_joins=" << stats_.rejected_joins;
  }

  if ( stats_.ignored ) {
    out << " ignored=" << stats_.ignored << "!";
  }

  out << "\n";
}
