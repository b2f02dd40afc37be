#include <cstdlib>
#include <iostream>

#include "messages.hh"
#include "socket.hh"

using namespace std;

static bool parse_yes_no( const string& str )
{
  if ( str == "yes" or str == "on" ) {
    return true;
  }
  if ( str == "no" or str == "off" ) {
    return false;
  }
  throw runtime_error( "expected yes|no (or on|off), got \"" + str + "\"" );
}

static Message make_event( const vector<string>& args )
{
  const string& command = args.at( 0 );

  if ( command == "join" and args.size() == 2 ) {
    return UiJoin { args[1] };
  } else if ( command == "call" and args.size() == 2 ) {
    return UiCall { args[1] };
  } else if ( command == "answer" and args.size() == 3 ) {
    return UiAnswer { args[1], parse_yes_no( args[2] ) };
  } else if ( command == "leave" and args.size() == 1 ) {
    return UiLeave {};
  } else if ( command == "chat" and args.size() >= 2 ) {
    string text;
    for ( size_t i = 1; i < args.size(); i++ ) {
      text += ( i > 1 ? " " : "" ) + args[i];
    }
    return UiChat { text };
  } else if ( command == "toggle" and args.size() == 3 ) {
    const auto medium = medium_from_string( args[1] );
    if ( not medium.has_value() or medium.value() == Medium::Chat ) {
      throw runtime_error( "toggle expects audio|video" );
    }
    return UiToggle { medium.value(), parse_yes_no( args[2] ) };
  }

  throw runtime_error( "bad usage" );
}

int main( int argc, char* argv[] )
{
  try {
    if ( argc <= 0 ) {
      abort();
    }

    if ( argc < 3 ) {
      cerr << "Usage: " << argv[0]
           << " UI_PORT join NAME | call NAME | answer CALLER yes|no | leave | chat TEXT... | toggle audio|video on|off\n";
      return EXIT_FAILURE;
    }

    const int port = stoi( argv[1] );
    if ( port <= 0 or port > 65535 ) {
      throw runtime_error( "invalid port " + to_string( port ) );
    }

    const Message event = make_event( vector<string>( argv + 2, argv + argc ) );

    UDPSocket socket;
    socket.sendto( { "127.0.0.1", uint16_t( port ) }, serialize( event ) );
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
