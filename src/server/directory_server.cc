#include "directory_server.hh"

#include <iostream>

using namespace std;

void DirectoryServer::Context::send_to( const ConnectionId conn, const Message& message )
{
  const auto connection = server_.connections_.find( conn );
  if ( connection == server_.connections_.end() ) {
    return;
  }

  server_.tasks_.push( connection->second.socket, serialize( message ) );
}

DirectoryServer::DirectoryServer( EventLoop& loop, const Address& listen_address, const uint64_t task_ttl_ms )
  : loop_( loop )
  , listener_()
  , tasks_( task_ttl_ms )
  , receive_category_( loop.add_category( "client receive" ) )
  , accept_category_( loop.add_category( "accept" ) )
{
  listener_.set_reuseaddr();
  listener_.bind( listen_address );
  listener_.listen();
  listener_.set_blocking( false );

  tasks_.install( loop_ );

  loop_.add_rule( accept_category_, listener_, Direction::In, [&] { accept_connection(); } );

  cerr << "Directory server listening on " << listener_.local_address().to_string() << "\n";
}

void DirectoryServer::accept_connection()
{
  auto socket = make_shared<TCPSocket>( listener_.accept() );
  socket->set_blocking( false );
  socket->set_nodelay();

  const ConnectionId id = next_connection_id_++;
  auto& connection = connections_.emplace( id, Connection { socket } ).first->second;
  stats_.accepted++;

  loop_.add_rule(
    receive_category_,
    *connection.socket,
    Direction::In,
    [this, id] { receive( id ); },
    [] { return true; },
    [this, id] { close_connection( id ); } );

  tasks_.watch( loop_, *connection.socket );

  cerr << "Connection " << id << " from " << socket->peer_address().to_string() << "\n";
}

void DirectoryServer::receive( const ConnectionId id )
{
  const auto it = connections_.find( id );
  if ( it == connections_.end() ) {
    return;
  }

  Connection& connection = it->second;

  string chunk;
  connection.socket->read( chunk );
  connection.decoder.push( chunk );

  while ( auto root = connection.decoder.pop() ) {
    const auto message = parse_message( root.value() );
    if ( not message.has_value() ) {
      stats_.malformed++;
      continue;
    }

    registry_.handle( context_, id, message.value() );
  }
}

void DirectoryServer::close_connection( const ConnectionId id )
{
  const auto it = connections_.find( id );
  if ( it == connections_.end() ) {
    return;
  }

  registry_.disconnect( context_, id );

  auto socket = it->second.socket;
  stats_.malformed += it->second.decoder.malformed();
  connections_.erase( it );

  tasks_.forget( socket->fd_num() );
  if ( not socket->closed() ) {
    socket->close();
  }
  stats_.closed++;

  cerr << "Connection " << id << " closed\n";
}

void DirectoryServer::summary( ostream& out ) const
{
  registry_.summary( out );
  tasks_.summary( out );

  out << "Connections: open=" << connections_.size() << " accepted=" << stats_.accepted;
  if ( stats_.malformed ) {
    out << " malformed=" << stats_.malformed << "!";
  }
  out << "\n";
}
