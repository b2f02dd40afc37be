#include "peer.hh"
#include "exception.hh"
#include "timer.hh"

#include <iostream>

using namespace std;

Peer::Peer( EventLoop& loop,
            const Address& server,
            Presentation& presentation,
            const MediaDevices& devices,
            const Session::Ports& ports,
            const uint64_t task_ttl_ms )
  : loop_( loop )
  , presentation_( presentation )
  , devices_( devices )
  , ports_( ports )
  , server_( make_shared<TCPSocket>() )
  , tasks_( task_ttl_ms )
  , chat_category_( loop.add_category( "chat receive" ) )
  , control_category_( loop.add_category( "control receive" ) )
{
  server_->connect( server );
  server_->set_blocking( false );
  server_->set_nodelay();

  ingress_.bind( { "127.0.0.1", uint16_t( 0 ) } );
  ingress_.set_blocking( false );

  tasks_.install( loop_ );
  tasks_.watch( loop_, *server_ );

  loop_.add_rule(
    "server receive",
    *server_,
    Direction::In,
    [&] { receive_from_server(); },
    [] { return true; },
    [&] {
      if ( not server_closed_ ) {
        server_closed_ = true;
        end_session();
        presentation_.on_banner( "Disconnected from directory server", Presentation::BANNER_DISMISS );
        cerr << "Directory server connection closed\n";
      }
    } );

  loop_.add_rule( "ui ingress", ingress_, Direction::In, [&] {
    received_datagram datagram { Address { "0.0.0.0", uint16_t( 0 ) }, {} };
    if ( not ingress_.recv( datagram ) ) {
      return;
    }

    const auto message = decode_message( datagram.payload );
    if ( not message.has_value() ) {
      stats_.malformed++;
      return;
    }
    handle_ui( message.value() );
  } );

  loop_.add_rule(
    "call maintenance", [&] { call_maintenance(); }, [&] { return session_ != nullptr; } );

  loop_.add_rule(
    "key request cleanup",
    [&] {
      if ( requester_->state() != KeyRequester::State::Done ) {
        stats_.key_exchange_failures++;
      }
      requester_.reset();
    },
    [&] { return requester_ and ( requester_->finished() or requester_->timed_out() ); } );

  cerr << "Connected to directory server " << server.to_string() << ", UI events on "
       << ingress_.local_address().to_string() << "\n";
}

Peer::~Peer()
{
  end_session();
}

void Peer::send_to_server( const Message& message )
{
  if ( server_closed_ ) {
    return;
  }
  tasks_.push( server_, serialize( message ) );
}

void Peer::receive_from_server()
{
  string chunk;
  server_->read( chunk );
  server_decoder_.push( chunk );

  while ( auto root = server_decoder_.pop() ) {
    const auto message = parse_message( root.value() );
    if ( not message.has_value() ) {
      stats_.malformed++;
      continue;
    }
    handle_server( message.value() );
  }
}

void Peer::handle_server( const Message& message )
{
  visit( overloaded {
           [&]( const JoinResponse& m ) {
             if ( not directory_.apply( m ) ) {
               presentation_.on_banner( "The name \"" + m.name + "\" is taken", Presentation::BANNER_DISMISS );
               return;
             }
             cerr << "Joined directory as " << m.name << "\n";
             presentation_.on_directory( directory_.users() );
             presentation_.on_calls( directory_.calls() );
           },
           [&]( const UserUpdate& m ) {
             directory_.apply( m );
             presentation_.on_directory( directory_.users() );
           },
           [&]( const CallParticipate& m ) { presentation_.on_call_prompt( m.caller ); },
           [&]( const CallUnavailable& m ) {
             presentation_.on_banner( m.callee + " is unavailable", Presentation::BANNER_DISMISS );
           },
           [&]( const CalleeResponse& m ) {
             if ( not m.accept ) {
               presentation_.on_banner( m.callee + " declined the call", Presentation::BANNER_DISMISS );
             }
           },
           [&]( const CallUpdate& m ) {
             const auto change = directory_.apply( m );
             presentation_.on_calls( directory_.calls() );

             switch ( change.action ) {
               case DirectoryMirror::SessionAction::Start:
                 start_session( change.call );
                 break;
               case DirectoryMirror::SessionAction::Update:
                 update_session( change.call );
                 break;
               case DirectoryMirror::SessionAction::End:
                 end_session();
                 break;
               case DirectoryMirror::SessionAction::None:
                 break;
             }
           },
           [&]( const auto& ) { stats_.ignored++; },
         },
         message );
}

void Peer::handle_ui( const Message& message )
{
  visit( overloaded {
           [&]( const UiJoin& m ) {
             if ( directory_.joined() ) {
               presentation_.on_banner( "Already joined as " + directory_.self(), Presentation::BANNER_DISMISS );
               return;
             }
             send_to_server( JoinRequest { m.name } );
           },
           [&]( const UiCall& m ) { send_to_server( CallRequest { m.callee } ); },
           [&]( const UiAnswer& m ) { send_to_server( CalleeResponse { m.caller, directory_.self(), m.accept } ); },
           [&]( const UiLeave& ) { send_to_server( SessionLeave {} ); },
           [&]( const UiChat& m ) {
             if ( not session_ ) {
               return;
             }
             const auto datagram = session_->seal( Medium::Chat, m.text );
             if ( datagram.has_value() ) {
               tasks_.push( session_->chat_socket(), session_->chat_destination(), datagram.value() );
               presentation_.on_chat( directory_.self(), m.text );
             }
           },
           [&]( const UiToggle& m ) {
             if ( session_ ) {
               session_->set_enabled( m.medium, m.enabled );
             }
           },
           [&]( const auto& ) { stats_.ignored++; },
         },
         message );
}

void Peer::start_session( const CallInfo& call )
{
  end_session();

  session_ = make_unique<Session>( directory_.self(), call, devices_, &presentation_, ports_ );

  auto chat = session_->chat_socket();
  auto control = session_->control_socket();

  session_rules_.push_back( loop_.add_rule( chat_category_, *chat, Direction::In, [&] { receive_chat(); } ) );
  session_rules_.push_back(
    loop_.add_rule( control_category_, *control, Direction::In, [&] { receive_control(); } ) );
  session_rules_.push_back( tasks_.watch( loop_, *chat ) );
  session_rules_.push_back( tasks_.watch( loop_, *control ) );

  next_feedback_ns_ = next_state_ns_ = next_statistics_ns_ = Timer::timestamp_ns();

  presentation_.on_call_start( call );

  if ( session_->is_master() ) {
    become_master();
  }
}

void Peer::update_session( const CallInfo& call )
{
  if ( not session_ ) {
    start_session( call );
    return;
  }

  for ( auto it = remote_state_.begin(); it != remote_state_.end(); ) {
    if ( call.includes( it->first ) ) {
      ++it;
    } else {
      it = remote_state_.erase( it );
    }
  }

  if ( session_->update_call( call ) ) {
    cerr << "Now master of call " << call.id << "\n";
    become_master();
  } else if ( not session_->is_master() and distributor_ ) {
    distributor_.reset();
  }
}

void Peer::end_session()
{
  if ( not session_ ) {
    return;
  }

  for ( auto& rule : session_rules_ ) {
    rule.cancel();
  }
  session_rules_.clear();

  tasks_.forget( session_->chat_socket()->fd_num() );
  tasks_.forget( session_->control_socket()->fd_num() );

  requester_.reset();
  distributor_.reset();
  remote_state_.clear();

  session_.reset();

  presentation_.on_call_end();
}

void Peer::become_master()
{
  if ( not session_->has_keys() ) {
    requester_.reset();
    session_->install_keys( SessionKeys::generate() );
  }

  distributor_ = make_unique<KeyDistributor>( loop_, session_->keys().value(), Address { "0.0.0.0", uint16_t( 0 ) } );
}

void Peer::request_keys( const Address& distributor )
{
  cerr << "Requesting call keys from " << distributor.to_string() << "\n";

  try {
    requester_ = make_unique<KeyRequester>( loop_, distributor, directory_.self(), [&]( const SessionKeys& keys ) {
      if ( session_ and not session_->has_keys() ) {
        session_->install_keys( keys );
      }
    } );
  } catch ( const unix_error& e ) {
    /* retried on the master's next announcement */
    stats_.key_exchange_failures++;
    cerr << "Key request failed: " << e.what() << "\n";
  }
}

void Peer::receive_chat()
{
  received_datagram datagram { Address { "0.0.0.0", uint16_t( 0 ) }, {} };
  if ( not session_->chat_socket()->recv( datagram ) ) {
    return;
  }

  const auto unit = session_->accept( datagram.payload, Medium::Chat );
  if ( unit.has_value() ) {
    presentation_.on_chat( unit->source, unit->payload );
  }
}

void Peer::receive_control()
{
  received_datagram datagram { Address { "0.0.0.0", uint16_t( 0 ) }, {} };
  if ( not session_->control_socket()->recv( datagram ) ) {
    return;
  }

  const auto message = decode_message( datagram.payload );
  if ( not message.has_value() ) {
    stats_.malformed++;
    return;
  }

  handle_control( datagram.source_address, message.value() );
}

void Peer::handle_control( const Address& source, const Message& message )
{
  visit( overloaded {
           [&]( const StateAnnounce& m ) {
             if ( m.source == directory_.self() or not session_->call().includes( m.source ) ) {
               return;
             }

             remote_state_[m.source] = m;

             if ( m.master and m.source == session_->call().master and m.key_port and not session_->has_keys()
                  and not requester_ ) {
               request_keys( Address { source.ip(), m.key_port } );
             }
           },
           [&]( const Feedback& m ) {
             if ( m.target == directory_.self() ) {
               session_->rate_controller().on_feedback( m, session_->is_master() );
             }
           },
           [&]( const auto& ) { stats_.ignored++; },
         },
         message );
}

void Peer::call_maintenance()
{
  const uint64_t now = Timer::timestamp_ns();

  if ( now >= next_feedback_ns_ ) {
    next_feedback_ns_ = now + FEEDBACK_INTERVAL_NS;
    for ( const auto& feedback : session_->collect_feedback() ) {
      if ( session_->is_master() ) {
        session_->rate_controller().on_feedback( feedback, true );
      } else {
        tasks_.push( session_->control_socket(), session_->control_destination(), serialize( feedback ) );
      }
    }
  }

  if ( now >= next_state_ns_ ) {
    next_state_ns_ = now + STATE_INTERVAL_NS;
    const uint16_t key_port = distributor_ ? distributor_->port() : 0;
    tasks_.push(
      session_->control_socket(), session_->control_destination(), serialize( session_->state( key_port ) ) );
  }

  if ( now >= next_statistics_ns_ ) {
    next_statistics_ns_ = now + STATISTICS_INTERVAL_NS;
    presentation_.on_statistics( session_->tracker_snapshots() );
  }
}

void Peer::summary( ostream& out ) const
{
  out << "Peer " << ( directory_.joined() ? directory_.self() : string( "(not joined)" ) ) << ":";
  out << " users=" << directory_.users().size() << " calls=" << directory_.calls().size();

  if ( requester_ ) {
    out << " key_exchange=pending";
  }
  if ( distributor_ ) {
    out << " keys_served=" << distributor_->served();
  }
  if ( stats_.key_exchange_failures ) {
    out << " key_exchange_failures=" << stats_.key_exchange_failures << "!";
  }
  if ( stats_.malformed ) {
    out << " malformed=" << stats_.malformed << "!";
  }

  for ( const auto& [name, state] : remote_state_ ) {
    out << " " << name << "[" << ( state.audio_enabled ? "a" : "-" ) << ( state.video_enabled ? "v" : "-" ) << "]";
  }
  out << "\n";

  tasks_.summary( out );

  if ( session_ ) {
    session_->summary( out );
  }
}
