#include "directory.hh"

using namespace std;

bool DirectoryMirror::apply( const JoinResponse& response )
{
  if ( not response.ok or joined_ ) {
    return false;
  }

  joined_ = true;
  self_ = response.name;

  users_.clear();
  for ( const auto& user : response.users ) {
    users_[user.name] = user.status;
  }

  calls_.clear();
  for ( const auto& call : response.calls ) {
    calls_[call.id] = call;
  }

  return true;
}

void DirectoryMirror::apply( const UserUpdate& update )
{
  if ( update.name == self_ ) {
    return;
  }

  switch ( update.kind ) {
    case UserUpdate::Kind::Join:
    case UserUpdate::Kind::Status:
      users_[update.name] = update.status;
      break;
    case UserUpdate::Kind::Leave:
      users_.erase( update.name );
      break;
  }
}

DirectoryMirror::Change DirectoryMirror::apply( const CallUpdate& update )
{
  const CallInfo& call = update.info;
  const bool mine = current_call_.has_value() and current_call_.value() == call.id;

  if ( update.kind == CallUpdate::Kind::CallRemove ) {
    calls_.erase( call.id );
    if ( mine ) {
      current_call_.reset();
      return { SessionAction::End, call };
    }
    return {};
  }

  calls_[call.id] = call;

  if ( mine ) {
    if ( call.includes( self_ ) ) {
      return { SessionAction::Update, call };
    }
    current_call_.reset();
    return { SessionAction::End, call };
  }

  /* a call that now includes us replaces whatever we were in */
  if ( call.includes( self_ ) and update.kind != CallUpdate::Kind::UserLeave ) {
    current_call_ = call.id;
    return { SessionAction::Start, call };
  }

  return {};
}

vector<UserInfo> DirectoryMirror::users() const
{
  vector<UserInfo> ret;
  for ( const auto& [name, status] : users_ ) {
    ret.push_back( { name, status } );
  }
  return ret;
}

vector<CallInfo> DirectoryMirror::calls() const
{
  vector<CallInfo> ret;
  for ( const auto& [id, call] : calls_ ) {
    ret.push_back( call );
  }
  return ret;
}

optional<CallInfo> DirectoryMirror::current_call() const
{
  if ( not current_call_.has_value() ) {
    return nullopt;
  }
  return calls_.at( current_call_.value() );
}
