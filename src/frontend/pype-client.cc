#include <csignal>
#include <cstdlib>
#include <iostream>

#include "console_presentation.hh"
#include "eventloop.hh"
#include "exception.hh"
#include "peer.hh"
#include "stats_printer.hh"
#include "synthetic_media.hh"

using namespace std;

void program_body( const string& host, const string& service )
{
  ios::sync_with_stdio( false );

  if ( signal( SIGPIPE, SIG_IGN ) == SIG_ERR ) {
    throw unix_error( "signal" );
  }

  auto loop = make_shared<EventLoop>();

  auto presentation = make_shared<ConsolePresentation>( cout, getenv( "PYPE_AUTO_ANSWER" ) != nullptr );

  auto playback = make_shared<CountingPlayback>();
  MediaDevices devices;
  devices.audio_capture = make_shared<ToneCapture>();
  devices.video_capture = make_shared<TestPatternCapture>();
  devices.audio_playback = playback;

  /* Peer registers itself in EventLoop */
  const Address directory_server { host, service };
  auto peer = make_shared<Peer>(
    *loop, directory_server, *presentation, devices, Session::Ports {}, TaskQueue::ttl_from_environment() );

  presentation->set_responder( [&]( const Message& message ) { peer->handle_ui_event( message ); } );

  cout << "UI events on port " << peer->ingress_address().port() << endl;

  const char* name = getenv( "PYPE_NAME" );
  if ( name ) {
    peer->handle_ui_event( UiJoin { name } );
  }

  /* Print out statistics to terminal */
  auto stats_printer = StatsPrinterTask::from_environment( loop, "pype-client" );
  if ( stats_printer ) {
    stats_printer->add( peer );
    stats_printer->add( playback );
    stats_printer->add( presentation );
  }

  while ( not peer->server_closed() and loop->wait_next_event( 100 ) != EventLoop::Result::Exit ) {
  }
}

int main( int argc, char* argv[] )
{
  try {
    if ( argc <= 0 ) {
      abort();
    }

    if ( argc < 2 or argc > 3 ) {
      cerr << "Usage: " << argv[0] << " server_host [server_port]\n";
      return EXIT_FAILURE;
    }

    program_body( argv[1], argc == 3 ? argv[2] : "5050" );
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
