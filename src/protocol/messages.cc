#include "messages.hh"

#include <memory>

using namespace std;

namespace {

void stamp( Json::Value& root, const char* type, const char* subtype )
{
  root["type"] = type;
  root["subtype"] = subtype;
}

void stamp_control( Json::Value& root, const char* mode )
{
  stamp( root, "session", "control" );
  root["mode"] = mode;
}

void stamp_ui( Json::Value& root, const char* subtype )
{
  stamp( root, "ui", subtype );
}

bool read( const Json::Value& root, const char* key, string& out )
{
  if ( not root.isMember( key ) or not root[key].isString() ) {
    return false;
  }
  out = root[key].asString();
  return true;
}

bool read( const Json::Value& root, const char* key, bool& out )
{
  if ( not root.isMember( key ) or not root[key].isBool() ) {
    return false;
  }
  out = root[key].asBool();
  return true;
}

bool read( const Json::Value& root, const char* key, uint64_t& out )
{
  if ( not root.isMember( key ) or not root[key].isUInt64() ) {
    return false;
  }
  out = root[key].asUInt64();
  return true;
}

bool read( const Json::Value& root, const char* key, unsigned int& out )
{
  if ( not root.isMember( key ) or not root[key].isUInt() ) {
    return false;
  }
  out = root[key].asUInt();
  return true;
}

bool read( const Json::Value& root, const char* key, uint16_t& out )
{
  unsigned int value;
  if ( not read( root, key, value ) or value > UINT16_MAX ) {
    return false;
  }
  out = value;
  return true;
}

/* "accept" / "reject" */
bool read_decision( const Json::Value& root, bool& accept )
{
  string status;
  if ( not read( root, "status", status ) ) {
    return false;
  }

  if ( status == "accept" ) {
    accept = true;
  } else if ( status == "reject" ) {
    accept = false;
  } else {
    return false;
  }

  return true;
}

bool read_status( const Json::Value& root, UserStatus& status )
{
  string str;
  if ( not read( root, "status", str ) ) {
    return false;
  }

  const auto parsed = user_status_from_string( str );
  if ( not parsed.has_value() ) {
    return false;
  }

  status = parsed.value();
  return true;
}

const char* to_cstr( const UserUpdate::Kind kind )
{
  switch ( kind ) {
    case UserUpdate::Kind::Join:
      return "join";
    case UserUpdate::Kind::Leave:
      return "leave";
    case UserUpdate::Kind::Status:
      return "status";
  }

  throw runtime_error( "unknown UserUpdate kind" );
}

const char* to_cstr( const CallUpdate::Kind kind )
{
  switch ( kind ) {
    case CallUpdate::Kind::CallAdd:
      return "call_add";
    case CallUpdate::Kind::CallRemove:
      return "call_remove";
    case CallUpdate::Kind::UserJoin:
      return "user_join";
    case CallUpdate::Kind::UserLeave:
      return "user_leave";
  }

  throw runtime_error( "unknown CallUpdate kind" );
}

template<class T>
optional<Message> parse_as( const Json::Value& root )
{
  T message;
  if ( not message.parse( root ) ) {
    return nullopt;
  }
  return Message { move( message ) };
}

}

string_view to_string( const UserStatus status )
{
  return status == UserStatus::Available ? "available" : "in call";
}

optional<UserStatus> user_status_from_string( const string_view str )
{
  if ( str == "available" ) {
    return UserStatus::Available;
  } else if ( str == "in call" ) {
    return UserStatus::InCall;
  }
  return nullopt;
}

string_view to_string( const Medium medium )
{
  switch ( medium ) {
    case Medium::Audio:
      return "audio";
    case Medium::Video:
      return "video";
    case Medium::Chat:
      return "chat";
  }

  throw runtime_error( "unknown Medium" );
}

optional<Medium> medium_from_string( const string_view str )
{
  if ( str == "audio" ) {
    return Medium::Audio;
  } else if ( str == "video" ) {
    return Medium::Video;
  } else if ( str == "chat" ) {
    return Medium::Chat;
  }
  return nullopt;
}

void CallInfo::to_json( Json::Value& root ) const
{
  root["id"] = Json::UInt64( id );
  root["master"] = master;
  root["participants"] = Json::arrayValue;
  for ( const auto& name : participants ) {
    root["participants"].append( name );
  }
  root["addresses"]["audio"] = addresses.audio;
  root["addresses"]["video"] = addresses.video;
  root["addresses"]["chat"] = addresses.chat;
}

bool CallInfo::parse( const Json::Value& root )
{
  if ( not root.isObject() or not read( root, "id", id ) or not read( root, "master", master ) ) {
    return false;
  }

  if ( not root.isMember( "participants" ) or not root["participants"].isArray() ) {
    return false;
  }

  participants.clear();
  for ( const auto& node : root["participants"] ) {
    if ( not node.isString() ) {
      return false;
    }
    participants.push_back( node.asString() );
  }

  if ( not root.isMember( "addresses" ) or not root["addresses"].isObject() ) {
    return false;
  }

  const Json::Value& addr = root["addresses"];
  return read( addr, "audio", addresses.audio ) and read( addr, "video", addresses.video )
         and read( addr, "chat", addresses.chat );
}

bool CallInfo::includes( const string_view name ) const
{
  for ( const auto& participant : participants ) {
    if ( participant == name ) {
      return true;
    }
  }
  return false;
}

void JoinRequest::to_json( Json::Value& root ) const
{
  stamp( root, type, subtype );
  root["name"] = name;
}

bool JoinRequest::parse( const Json::Value& root )
{
  return read( root, "name", name );
}

void CallRequest::to_json( Json::Value& root ) const
{
  stamp( root, type, subtype );
  root["callee"] = callee;
}

bool CallRequest::parse( const Json::Value& root )
{
  return read( root, "callee", callee );
}

void CalleeResponse::to_json( Json::Value& root ) const
{
  stamp( root, type, subtype );
  root["caller"] = caller;
  root["callee"] = callee;
  root["status"] = accept ? "accept" : "reject";
}

bool CalleeResponse::parse( const Json::Value& root )
{
  return read( root, "caller", caller ) and read( root, "callee", callee ) and read_decision( root, accept );
}

void SessionLeave::to_json( Json::Value& root ) const
{
  stamp( root, type, subtype );
}

void JoinResponse::to_json( Json::Value& root ) const
{
  stamp( root, type, subtype );
  root["status"] = ok ? "ok" : "no";
  root["name"] = name;

  if ( not ok ) {
    return;
  }

  root["user_info_lst"] = Json::arrayValue;
  for ( const auto& user : users ) {
    Json::Value node;
    node["name"] = user.name;
    node["status"] = string( to_string( user.status ) );
    root["user_info_lst"].append( node );
  }

  root["call_info_lst"] = Json::arrayValue;
  for ( const auto& call : calls ) {
    Json::Value node;
    call.to_json( node );
    root["call_info_lst"].append( node );
  }
}

bool JoinResponse::parse( const Json::Value& root )
{
  string status;
  if ( not read( root, "status", status ) or not read( root, "name", name ) ) {
    return false;
  }

  if ( status == "no" ) {
    ok = false;
    return true;
  } else if ( status != "ok" ) {
    return false;
  }

  ok = true;

  if ( not root.isMember( "user_info_lst" ) or not root["user_info_lst"].isArray()
       or not root.isMember( "call_info_lst" ) or not root["call_info_lst"].isArray() ) {
    return false;
  }

  users.clear();
  for ( const auto& node : root["user_info_lst"] ) {
    UserInfo user;
    if ( not node.isObject() or not read( node, "name", user.name ) or not read_status( node, user.status ) ) {
      return false;
    }
    users.push_back( move( user ) );
  }

  calls.clear();
  for ( const auto& node : root["call_info_lst"] ) {
    CallInfo call;
    if ( not call.parse( node ) ) {
      return false;
    }
    calls.push_back( move( call ) );
  }

  return true;
}

void UserUpdate::to_json( Json::Value& root ) const
{
  stamp( root, type, to_cstr( kind ) );
  root["name"] = name;
  root["status"] = string( to_string( status ) );
}

bool UserUpdate::parse( const Json::Value& root )
{
  string sub;
  if ( not read( root, "subtype", sub ) ) {
    return false;
  }

  if ( sub == "join" ) {
    kind = Kind::Join;
  } else if ( sub == "leave" ) {
    kind = Kind::Leave;
  } else if ( sub == "status" ) {
    kind = Kind::Status;
  } else {
    return false;
  }

  return read( root, "name", name ) and read_status( root, status );
}

void CallParticipate::to_json( Json::Value& root ) const
{
  stamp( root, type, subtype );
  root["caller"] = caller;
}

bool CallParticipate::parse( const Json::Value& root )
{
  return read( root, "caller", caller );
}

void CallUnavailable::to_json( Json::Value& root ) const
{
  stamp( root, type, subtype );
  root["callee"] = callee;
  root["status"] = "unavailable";
}

bool CallUnavailable::parse( const Json::Value& root )
{
  string status;
  return read( root, "status", status ) and status == "unavailable" and read( root, "callee", callee );
}

void CallUpdate::to_json( Json::Value& root ) const
{
  stamp( root, type, to_cstr( kind ) );
  root["master"] = master;
  root["name"] = name;
  info.to_json( root["info"] );
}

bool CallUpdate::parse( const Json::Value& root )
{
  string sub;
  if ( not read( root, "subtype", sub ) ) {
    return false;
  }

  if ( sub == "call_add" ) {
    kind = Kind::CallAdd;
  } else if ( sub == "call_remove" ) {
    kind = Kind::CallRemove;
  } else if ( sub == "user_join" ) {
    kind = Kind::UserJoin;
  } else if ( sub == "user_leave" ) {
    kind = Kind::UserLeave;
  } else {
    return false;
  }

  return read( root, "master", master ) and read( root, "name", name ) and root.isMember( "info" )
         and info.parse( root["info"] );
}

void SessionContent::to_json( Json::Value& root ) const
{
  stamp( root, type, subtype );
  root["payload"] = payload;
}

bool SessionContent::parse( const Json::Value& root )
{
  return read( root, "payload", payload );
}

void PubKey::to_json( Json::Value& root ) const
{
  stamp_control( root, mode );
  root["source"] = source;
  root["public_key"] = public_key_pem;
}

bool PubKey::parse( const Json::Value& root )
{
  return read( root, "source", source ) and read( root, "public_key", public_key_pem );
}

void KeyInfo::to_json( Json::Value& root ) const
{
  stamp_control( root, mode );
  root["sealed_key"] = sealed_key;
  root["iv"] = iv;
}

bool KeyInfo::parse( const Json::Value& root )
{
  return read( root, "sealed_key", sealed_key ) and read( root, "iv", iv );
}

void Feedback::to_json( Json::Value& root ) const
{
  stamp_control( root, mode );
  root["source"] = source;
  root["target"] = target;
  root["rate"] = rate;
}

bool Feedback::parse( const Json::Value& root )
{
  return read( root, "source", source ) and read( root, "target", target ) and read( root, "rate", rate );
}

void StateAnnounce::to_json( Json::Value& root ) const
{
  stamp_control( root, mode );
  root["source"] = source;
  root["master"] = master;
  root["key_port"] = key_port;
  root["audio"] = audio_enabled;
  root["video"] = video_enabled;
}

bool StateAnnounce::parse( const Json::Value& root )
{
  return read( root, "source", source ) and read( root, "master", master ) and read( root, "key_port", key_port )
         and read( root, "audio", audio_enabled ) and read( root, "video", video_enabled );
}

void UiJoin::to_json( Json::Value& root ) const
{
  stamp_ui( root, subtype );
  root["name"] = name;
}

bool UiJoin::parse( const Json::Value& root )
{
  return read( root, "name", name );
}

void UiCall::to_json( Json::Value& root ) const
{
  stamp_ui( root, subtype );
  root["callee"] = callee;
}

bool UiCall::parse( const Json::Value& root )
{
  return read( root, "callee", callee );
}

void UiAnswer::to_json( Json::Value& root ) const
{
  stamp_ui( root, subtype );
  root["caller"] = caller;
  root["status"] = accept ? "accept" : "reject";
}

bool UiAnswer::parse( const Json::Value& root )
{
  return read( root, "caller", caller ) and read_decision( root, accept );
}

void UiLeave::to_json( Json::Value& root ) const
{
  stamp_ui( root, subtype );
}

void UiChat::to_json( Json::Value& root ) const
{
  stamp_ui( root, subtype );
  root["text"] = text;
}

bool UiChat::parse( const Json::Value& root )
{
  return read( root, "text", text );
}

void UiToggle::to_json( Json::Value& root ) const
{
  stamp_ui( root, subtype );
  root["medium"] = string( to_string( medium ) );
  root["enabled"] = enabled;
}

bool UiToggle::parse( const Json::Value& root )
{
  string medium_name;
  if ( not read( root, "medium", medium_name ) or not read( root, "enabled", enabled ) ) {
    return false;
  }

  const auto parsed = medium_from_string( medium_name );
  if ( not parsed.has_value() ) {
    return false;
  }
  medium = parsed.value();
  return true;
}

Json::Value to_json( const Message& message )
{
  Json::Value root { Json::objectValue };
  visit( [&]( const auto& m ) { m.to_json( root ); }, message );
  return root;
}

string serialize( const Message& message )
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString( builder, to_json( message ) );
}

optional<Message> parse_message( const Json::Value& root )
{
  if ( not root.isObject() ) {
    return nullopt;
  }

  string type, subtype;
  if ( not read( root, "type", type ) or not read( root, "subtype", subtype ) ) {
    return nullopt;
  }

  if ( type == "join" ) {
    if ( subtype == "request" ) {
      return parse_as<JoinRequest>( root );
    } else if ( subtype == "response" ) {
      return parse_as<JoinResponse>( root );
    }
  } else if ( type == "user_update" ) {
    return parse_as<UserUpdate>( root );
  } else if ( type == "call" ) {
    if ( subtype == "request" ) {
      return parse_as<CallRequest>( root );
    } else if ( subtype == "participate" ) {
      return parse_as<CallParticipate>( root );
    } else if ( subtype == "callee_response" ) {
      return parse_as<CalleeResponse>( root );
    } else if ( subtype == "response" ) {
      return parse_as<CallUnavailable>( root );
    }
  } else if ( type == "call_update" ) {
    return parse_as<CallUpdate>( root );
  } else if ( type == "session" ) {
    if ( subtype == "leave" ) {
      return parse_as<SessionLeave>( root );
    } else if ( subtype == "content" ) {
      return parse_as<SessionContent>( root );
    } else if ( subtype == "control" ) {
      string mode;
      if ( not read( root, "mode", mode ) ) {
        return nullopt;
      }

      if ( mode == PubKey::mode ) {
        return parse_as<PubKey>( root );
      } else if ( mode == KeyInfo::mode ) {
        return parse_as<KeyInfo>( root );
      } else if ( mode == Feedback::mode ) {
        return parse_as<Feedback>( root );
      } else if ( mode == StateAnnounce::mode ) {
        return parse_as<StateAnnounce>( root );
      }
    }
  } else if ( type == "ui" ) {
    if ( subtype == UiJoin::subtype ) {
      return parse_as<UiJoin>( root );
    } else if ( subtype == UiCall::subtype ) {
      return parse_as<UiCall>( root );
    } else if ( subtype == UiAnswer::subtype ) {
      return parse_as<UiAnswer>( root );
    } else if ( subtype == UiLeave::subtype ) {
      return parse_as<UiLeave>( root );
    } else if ( subtype == UiChat::subtype ) {
      return parse_as<UiChat>( root );
    } else if ( subtype == UiToggle::subtype ) {
      return parse_as<UiToggle>( root );
    }
  }

  return nullopt;
}

optional<Message> decode_message( const string_view text )
{
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  const unique_ptr<Json::CharReader> reader { builder.newCharReader() };

  Json::Value root;
  string errors;
  if ( not reader->parse( text.data(), text.data() + text.size(), &root, &errors ) ) {
    return nullopt;
  }

  return parse_message( root );
}
