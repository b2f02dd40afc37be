#include "framing.hh"
#include "base64.hh"

#include <memory>

using namespace std;

namespace {

string unit_to_json( const MediaUnit& unit )
{
  Json::Value root;
  root["medium"] = string( to_string( unit.medium ) );
  root["sequence"] = Json::UInt64( unit.sequence );
  root["session_nonce"] = Json::UInt64( unit.session_nonce );
  root["packet_nonce"] = Json::UInt64( unit.packet_nonce );
  root["source"] = unit.source;
  root["timestamp"] = unit.timestamp;
  root["payload"] = base64_encode( unit.payload );

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString( builder, root );
}

optional<MediaUnit> unit_from_json( const string_view text )
{
  Json::CharReaderBuilder builder;
  const unique_ptr<Json::CharReader> reader { builder.newCharReader() };

  Json::Value root;
  string errors;
  if ( not reader->parse( text.data(), text.data() + text.size(), &root, &errors ) or not root.isObject() ) {
    return nullopt;
  }

  for ( const char* key : { "sequence", "session_nonce", "packet_nonce" } ) {
    if ( not root.isMember( key ) or not root[key].isUInt64() ) {
      return nullopt;
    }
  }

  for ( const char* key : { "medium", "source", "payload" } ) {
    if ( not root.isMember( key ) or not root[key].isString() ) {
      return nullopt;
    }
  }

  if ( not root.isMember( "timestamp" ) or not root["timestamp"].isNumeric() ) {
    return nullopt;
  }

  const auto medium = medium_from_string( root["medium"].asString() );
  if ( not medium.has_value() ) {
    return nullopt;
  }

  MediaUnit unit;
  unit.medium = medium.value();
  unit.sequence = root["sequence"].asUInt64();
  unit.session_nonce = root["session_nonce"].asUInt64();
  unit.packet_nonce = root["packet_nonce"].asUInt64();
  unit.source = root["source"].asString();
  unit.timestamp = root["timestamp"].asDouble();

  if ( not base64_decode( root["payload"].asString(), unit.payload ) ) {
    return nullopt;
  }

  return unit;
}

}

string seal_unit( const CipherSession& cipher, const MediaUnit& unit )
{
  return serialize( SessionContent { base64_encode( cipher.encrypt( unit_to_json( unit ) ) ) } );
}

optional<MediaUnit> open_unit( const CipherSession& cipher, const string_view datagram, OpenError* error )
{
  const auto fail = [&]( const OpenError reason ) -> optional<MediaUnit> {
    if ( error ) {
      *error = reason;
    }
    return nullopt;
  };

  const auto message = decode_message( datagram );
  if ( not message.has_value() or not holds_alternative<SessionContent>( message.value() ) ) {
    return fail( OpenError::NotContent );
  }

  string ciphertext, plaintext;
  if ( not base64_decode( get<SessionContent>( message.value() ).payload, ciphertext )
       or not cipher.decrypt( ciphertext, plaintext ) ) {
    return fail( OpenError::Undecryptable );
  }

  auto unit = unit_from_json( plaintext );
  if ( not unit.has_value() ) {
    return fail( OpenError::Malformed );
  }

  return unit;
}
