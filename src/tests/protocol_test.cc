#include <cstdlib>
#include <iostream>

#include "json_stream.hh"
#include "messages.hh"
#include "test_util.hh"

using namespace std;

void test_stream_splitting()
{
  JsonStreamDecoder decoder;

  const string first = serialize( JoinRequest { "alice" } );
  const string second = serialize( CallRequest { "bob" } );
  const string both = first + second;

  /* byte at a time: nothing until the closing brace */
  for ( size_t i = 0; i + 1 < first.size(); i++ ) {
    decoder.push( both.substr( i, 1 ) );
    expect( not decoder.pop().has_value(), "incomplete object held back" );
  }
  decoder.push( both.substr( first.size() - 1 ) );

  const auto one = decoder.pop();
  expect( one.has_value(), "first object complete" );
  expect_eq( ( *one )["name"].asString(), "alice", "first object content" );

  const auto two = decoder.pop();
  expect( two.has_value(), "second object complete" );
  expect_eq( ( *two )["callee"].asString(), "bob", "second object content" );

  expect( not decoder.pop().has_value(), "nothing left" );
  expect_eq( decoder.buffered(), 0u, "buffer drained" );
}

void test_braces_inside_strings()
{
  JsonStreamDecoder decoder;
  decoder.push( R"({"type":"ui","subtype":"chat","text":"} not the end \" { still text"}{"a":1})" );

  const auto chat = decoder.pop();
  expect( chat.has_value(), "object with braces in a string" );

  const auto message = parse_message( chat.value() );
  expect( message.has_value() and holds_alternative<UiChat>( message.value() ), "parsed as chat" );
  expect_eq( get<UiChat>( message.value() ).text, R"(} not the end " { still text)", "text intact" );

  expect( decoder.pop().has_value(), "following object" );
}

void test_malformed_skipped()
{
  JsonStreamDecoder decoder;
  decoder.push( "garbage {\"a\":} {\"b\":2}" );

  const auto value = decoder.pop();
  expect( value.has_value(), "valid object after a malformed one" );
  expect_eq( ( *value )["b"].asInt(), 2, "right object" );
  expect_eq( decoder.malformed(), 1u, "malformed object counted" );
}

void test_wire_formats()
{
  const auto unavailable = to_json( CallUnavailable { "bob" } );
  expect_eq( unavailable["type"].asString(), "call", "type" );
  expect_eq( unavailable["subtype"].asString(), "response", "subtype" );
  expect_eq( unavailable["status"].asString(), "unavailable", "status" );

  const auto rejected = to_json( JoinResponse { false, "alice", {}, {} } );
  expect_eq( rejected["status"].asString(), "no", "rejected join" );
  expect( not rejected.isMember( "user_info_lst" ), "no roster on rejection" );

  CallInfo call { 7, "alice", { "alice", "bob" }, { "239.0.0.1", "239.0.0.2", "239.0.0.3" } };
  const auto accepted = to_json( JoinResponse { true, "carol", { { "alice", UserStatus::InCall } }, { call } } );
  expect_eq( accepted["user_info_lst"][0]["status"].asString(), "in call", "status wording" );
  expect_eq( accepted["call_info_lst"][0]["participants"][1].asString(), "bob", "participants" );

  const auto parsed = decode_message( serialize( JoinResponse { true, "carol", { { "alice", UserStatus::InCall } }, { call } } ) );
  expect( parsed.has_value() and holds_alternative<JoinResponse>( parsed.value() ), "join response parses" );
  const auto& response = get<JoinResponse>( parsed.value() );
  expect( response.ok and response.users.size() == 1 and response.calls.size() == 1, "rosters" );
  expect( response.calls.front().addresses == call.addresses, "addresses" );

  const auto update = to_json( CallUpdate { CallUpdate::Kind::UserLeave, "bob", "alice", call } );
  expect_eq( update["subtype"].asString(), "user_leave", "call update kind" );
  expect_eq( update["info"]["master"].asString(), "alice", "embedded call info" );

  const auto feedback = to_json( Feedback { "bob", "alice", 12 } );
  expect_eq( feedback["mode"].asString(), "feedback", "control mode" );
  expect_eq( feedback["subtype"].asString(), "control", "control subtype" );

  const auto response_msg = decode_message( R"({"type":"call","subtype":"callee_response","caller":"a","callee":"b","status":"reject"})" );
  expect( response_msg.has_value() and not get<CalleeResponse>( response_msg.value() ).accept, "reject decision" );
}

void test_rejects()
{
  expect( not decode_message( "not json" ).has_value(), "not JSON" );
  expect( not decode_message( "[1,2]" ).has_value(), "not an object" );
  expect( not decode_message( R"({"type":"join"})" ).has_value(), "missing subtype" );
  expect( not decode_message( R"({"type":"join","subtype":"request"})" ).has_value(), "missing name" );
  expect( not decode_message( R"({"type":"join","subtype":"request","name":5})" ).has_value(), "mistyped name" );
  expect( not decode_message( R"({"type":"nope","subtype":"request"})" ).has_value(), "unknown type" );
  expect( not decode_message( R"({"type":"session","subtype":"control","mode":"x"})" ).has_value(), "unknown mode" );
  expect( not decode_message( R"({"type":"call","subtype":"callee_response","caller":"a","callee":"b","status":"maybe"})" )
                .has_value(),
          "unknown decision" );
  expect( not decode_message( R"({"type":"session","subtype":"control","mode":"state","source":"a","master":true,"key_port":70000,"audio":true,"video":true})" )
                .has_value(),
          "port out of range" );
}

void program_body()
{
  test_stream_splitting();
  test_braces_inside_strings();
  test_malformed_skipped();
  test_wire_formats();
  test_rejects();
}

int main()
{
  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  cout << "protocol: all tests passed\n";
  return EXIT_SUCCESS;
}
