#include "key_exchange.hh"
#include "base64.hh"
#include "exception.hh"
#include "timer.hh"

#include <iostream>

using namespace std;

optional<KeyInfo> KeyDistributor::seal_keys( const SessionKeys& keys, const string& public_key_pem )
{
  Json::Value secret;
  secret["key"] = base64_encode( keys.key );
  secret["session_nonce"] = Json::UInt64( keys.session_nonce );

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";

  string sealed;
  if ( not KeyPair::encrypt_for( public_key_pem, Json::writeString( builder, secret ), sealed ) ) {
    return nullopt;
  }

  return KeyInfo { base64_encode( sealed ), base64_encode( keys.iv ) };
}

KeyDistributor::KeyDistributor( EventLoop& loop, const SessionKeys& keys, const Address& listen_address )
  : loop_( loop )
  , keys_( keys )
  , listener_()
  , receive_category_( loop.add_category( "key distribution receive" ) )
  , send_category_( loop.add_category( "key distribution send" ) )
{
  listener_.set_reuseaddr();
  listener_.bind( listen_address );
  listener_.listen();
  listener_.set_blocking( false );

  listener_rule_ = loop_.add_rule(
    "key distribution accept", listener_, Direction::In, [&] { accept_connection(); } );

  cerr << "Key distribution listening on port " << port() << "\n";
}

KeyDistributor::~KeyDistributor()
{
  if ( listener_rule_.has_value() ) {
    listener_rule_->cancel();
  }
  for ( auto& [id, connection] : connections_ ) {
    for ( auto& rule : connection.rules ) {
      rule.cancel();
    }
    if ( not connection.socket->closed() ) {
      connection.socket->close();
    }
  }
  listener_.close();
}

void KeyDistributor::accept_connection()
{
  auto socket = make_shared<TCPSocket>( listener_.accept() );
  socket->set_blocking( false );

  const uint64_t id = next_connection_id_++;
  auto& connection = connections_.emplace( id, Connection { socket } ).first->second;

  connection.rules.push_back( loop_.add_rule(
    receive_category_,
    *socket,
    Direction::In,
    [this, id] { receive( id ); },
    [] { return true; },
    [this, id] { close_connection( id ); } ) );

  connection.rules.push_back( loop_.add_rule(
    send_category_,
    *socket,
    Direction::Out,
    [this, id] { send( id ); },
    [this, id] {
      const auto it = connections_.find( id );
      return it != connections_.end() and not it->second.outbound.empty();
    },
    [this, id] { close_connection( id ); } ) );
}

void KeyDistributor::receive( const uint64_t id )
{
  const auto it = connections_.find( id );
  if ( it == connections_.end() ) {
    return;
  }

  Connection& connection = it->second;

  string chunk;
  connection.socket->read( chunk );
  connection.decoder.push( chunk );

  const auto root = connection.decoder.pop();
  if ( not root.has_value() ) {
    return;
  }

  const auto message = parse_message( root.value() );
  if ( not message.has_value() or not holds_alternative<PubKey>( message.value() ) ) {
    refused_++;
    close_connection( id );
    return;
  }

  const auto& request = get<PubKey>( message.value() );
  const auto reply = seal_keys( keys_, request.public_key_pem );
  if ( not reply.has_value() ) {
    cerr << "Key distribution: unusable public key from " << request.source << "\n";
    refused_++;
    close_connection( id );
    return;
  }

  connection.outbound = serialize( reply.value() );
  served_++;
  cerr << "Key distribution: sent key material to " << request.source << "\n";
}

void KeyDistributor::send( const uint64_t id )
{
  const auto it = connections_.find( id );
  if ( it == connections_.end() ) {
    return;
  }

  Connection& connection = it->second;
  connection.outbound.erase( 0, connection.socket->write( connection.outbound ) );

  if ( connection.outbound.empty() ) {
    close_connection( id );
  }
}

void KeyDistributor::close_connection( const uint64_t id )
{
  const auto it = connections_.find( id );
  if ( it == connections_.end() ) {
    return;
  }

  for ( auto& rule : it->second.rules ) {
    rule.cancel();
  }
  if ( not it->second.socket->closed() ) {
    it->second.socket->close();
  }
  connections_.erase( it );
}

KeyRequester::KeyRequester( EventLoop& loop,
                            const Address& distributor,
                            const string& self,
                            const Callback& on_keys )
  : socket_( make_shared<TCPSocket>() )
  , on_keys_( on_keys )
  , deadline_ns_( Timer::timestamp_ns() + TIMEOUT_NS )
{
  socket_->set_blocking( false );
  socket_->connect( distributor );

  outbound_ = serialize( PubKey { self, keypair_.public_key_pem() } );

  rules_.push_back( loop.add_rule(
    "key request receive",
    *socket_,
    Direction::In,
    [this] { receive(); },
    [] { return true; },
    [this] {
      if ( not finished() ) {
        finish( State::Failed );
      }
    } ) );

  rules_.push_back( loop.add_rule(
    "key request send",
    *socket_,
    Direction::Out,
    [this] { send(); },
    [this] { return not outbound_.empty(); },
    [this] {
      if ( not finished() ) {
        finish( State::Failed );
      }
    } ) );
}

KeyRequester::~KeyRequester()
{
  for ( auto& rule : rules_ ) {
    rule.cancel();
  }
  if ( not socket_->closed() ) {
    socket_->close();
  }
}

bool KeyRequester::timed_out() const
{
  return not finished() and Timer::timestamp_ns() > deadline_ns_;
}

bool KeyRequester::unseal_keys( const KeyPair& keypair, const KeyInfo& info, SessionKeys& keys )
{
  string sealed, secret_json;
  if ( not base64_decode( info.sealed_key, sealed ) or not keypair.decrypt( sealed, secret_json ) ) {
    return false;
  }

  Json::CharReaderBuilder builder;
  const unique_ptr<Json::CharReader> reader { builder.newCharReader() };
  Json::Value secret;
  string errors;
  if ( not reader->parse( secret_json.data(), secret_json.data() + secret_json.size(), &secret, &errors )
       or not secret.isObject() or not secret.isMember( "key" ) or not secret["key"].isString()
       or not secret.isMember( "session_nonce" ) or not secret["session_nonce"].isUInt64() ) {
    return false;
  }

  SessionKeys unsealed;
  unsealed.session_nonce = secret["session_nonce"].asUInt64();
  if ( not base64_decode( secret["key"].asString(), unsealed.key ) or not base64_decode( info.iv, unsealed.iv )
       or not unsealed.valid() ) {
    return false;
  }

  keys = move( unsealed );
  return true;
}

void KeyRequester::receive()
{
  string chunk;
  socket_->read( chunk );
  decoder_.push( chunk );

  const auto root = decoder_.pop();
  if ( not root.has_value() ) {
    return;
  }

  const auto message = parse_message( root.value() );
  SessionKeys keys;
  if ( not message.has_value() or not holds_alternative<KeyInfo>( message.value() )
       or not unseal_keys( keypair_, get<KeyInfo>( message.value() ), keys ) ) {
    cerr << "Key request: bad reply from distributor\n";
    finish( State::Failed );
    return;
  }

  finish( State::Done );
  on_keys_( keys );
}

void KeyRequester::send()
{
  if ( not connected_ ) {
    try {
      socket_->throw_if_error();
    } catch ( const unix_error& e ) {
      cerr << "Key request: connect failed: " << e.what() << "\n";
      finish( State::Failed );
      return;
    }
    connected_ = true;
  }

  outbound_.erase( 0, socket_->write( outbound_ ) );
}

void KeyRequester::finish( const State state )
{
  state_ = state;
  for ( auto& rule : rules_ ) {
    rule.cancel();
  }
  if ( not socket_->closed() ) {
    socket_->close();
  }
}
