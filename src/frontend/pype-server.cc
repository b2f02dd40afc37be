#include <csignal>
#include <cstdlib>
#include <iostream>

#include "directory_server.hh"
#include "eventloop.hh"
#include "exception.hh"
#include "stats_printer.hh"

using namespace std;

static constexpr uint16_t DEFAULT_PORT = 5050;

void program_body( const uint16_t port )
{
  ios::sync_with_stdio( false );

  /* a peer that disappears mid-write must not kill the directory */
  if ( signal( SIGPIPE, SIG_IGN ) == SIG_ERR ) {
    throw unix_error( "signal" );
  }

  auto loop = make_shared<EventLoop>();

  /* Directory server registers itself in EventLoop */
  auto server = make_shared<DirectoryServer>(
    *loop, Address { "0.0.0.0", port }, TaskQueue::ttl_from_environment() );

  /* Print out statistics to terminal */
  auto stats_printer = StatsPrinterTask::from_environment( loop, "pype-server" );
  if ( stats_printer ) {
    stats_printer->add( server );
  }

  while ( loop->wait_next_event( stats_printer ? stats_printer->wait_time_ms() : 1000 )
          != EventLoop::Result::Exit ) {
  }
}

int main( int argc, char* argv[] )
{
  try {
    if ( argc <= 0 ) {
      abort();
    }

    if ( argc > 2 ) {
      cerr << "Usage: " << argv[0] << " [port]\n";
      return EXIT_FAILURE;
    }

    const int port = argc == 2 ? stoi( argv[1] ) : DEFAULT_PORT;
    if ( port <= 0 or port > 65535 ) {
      throw runtime_error( "invalid port " + to_string( port ) );
    }

    program_body( port );
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
