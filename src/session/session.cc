#include "session.hh"
#include "audio_codec.hh"
#include "timer.hh"

#include <chrono>
#include <iomanip>
#include <iostream>

using namespace std;
using namespace std::chrono;

namespace {

/* a worker that hits a resource fault stops alone and says why */
template<class Function>
thread start_worker( const string name, Function&& function )
{
  return thread( [name, function = forward<Function>( function )] {
    try {
      function();
    } catch ( const exception& e ) {
      cerr << "Session worker \"" << name << "\" stopped: " << e.what() << "\n";
    }
  } );
}

}

Address Session::group_address( const string& group, const uint16_t port )
{
  Address address { group, port };
  if ( not address.is_multicast() ) {
    throw runtime_error( "call address is not a multicast group: " + group );
  }
  return address;
}

void Session::join_group( UDPSocket& socket, const Address& group )
{
  socket.set_reuseaddr();
  socket.bind( group );
  socket.join_multicast_group( group );
  socket.set_multicast_loopback( true );
  socket.set_multicast_ttl( 1 );
}

Session::Session( const string& self,
                  const CallInfo& call,
                  const MediaDevices& devices,
                  SessionObserver* observer,
                  const Ports& ports )
  : self_( self )
  , call_( call )
  , devices_( devices )
  , observer_( observer )
  , audio_group_( group_address( call.addresses.audio, ports.content ) )
  , video_group_( group_address( call.addresses.video, ports.content ) )
  , chat_group_( group_address( call.addresses.chat, ports.content ) )
  , control_group_( group_address( call.addresses.chat, ports.control ) )
  , chat_socket_( make_shared<UDPSocket>() )
  , control_socket_( make_shared<UDPSocket>() )
  , participants_( call.participants.begin(), call.participants.end() )
{
  join_group( audio_socket_, audio_group_ );
  audio_socket_.set_receive_timeout_ms( WORKER_POLL_MS );

  join_group( video_socket_, video_group_ );
  video_socket_.set_receive_timeout_ms( WORKER_POLL_MS );

  join_group( *chat_socket_, chat_group_ );
  chat_socket_->set_blocking( false );

  join_group( *control_socket_, control_group_ );
  control_socket_->set_blocking( false );

  cerr << "Session for call " << call_.id << " (master " << call_.master << "): audio " << audio_group_.to_string()
       << ", video " << video_group_.to_string() << ", chat " << chat_group_.to_string() << "\n";
}

Session::~Session()
{
  stop();
}

void Session::stop()
{
  if ( not keep_running_.exchange( false ) ) {
    return;
  }

  /* devices only run once keys have arrived */
  if ( cipher_.has_value() ) {
    if ( devices_.audio_capture ) {
      devices_.audio_capture->stop();
    }
    if ( devices_.video_capture ) {
      devices_.video_capture->stop();
    }
  }

  for ( auto& worker : workers_ ) {
    if ( worker.joinable() ) {
      worker.join();
    }
  }

  /* the audio receiver is gone, so no new playbacks appear */
  for ( auto& [source, playback] : playbacks_ ) {
    playback->keep_running = false;
    if ( playback->thread.joinable() ) {
      playback->thread.join();
    }
  }

  if ( cipher_.has_value() and devices_.audio_playback ) {
    devices_.audio_playback->stop();
  }

  cerr << "Session for call " << call_.id << " ended\n";
}

bool Session::update_call( const CallInfo& call )
{
  const bool was_master = is_master();
  const string old_master = call_.master;

  for ( const auto& name : call_.participants ) {
    if ( not call.includes( name ) ) {
      rate_controller_.on_participant_left( name );
      forget_participant( name );
    }
  }

  {
    lock_guard<mutex> lock { trackers_mutex_ };
    participants_ = set<string>( call.participants.begin(), call.participants.end() );
  }

  call_ = call;

  if ( call_.master != old_master ) {
    rate_controller_.on_master_changed();
  }

  return is_master() and not was_master;
}

void Session::forget_participant( const string& name )
{
  {
    lock_guard<mutex> lock { trackers_mutex_ };
    participants_.erase( name );
    for ( auto it = trackers_.begin(); it != trackers_.end(); ) {
      if ( it->first.first == name ) {
        it = trackers_.erase( it );
      } else {
        ++it;
      }
    }
  }

  shared_ptr<Playback> playback;
  {
    lock_guard<mutex> lock { playbacks_mutex_ };
    const auto it = playbacks_.find( name );
    if ( it == playbacks_.end() ) {
      return;
    }
    playback = move( it->second );
    playbacks_.erase( it );
  }

  playback->keep_running = false;
  if ( playback->thread.joinable() ) {
    playback->thread.join();
  }
}

optional<SessionKeys> Session::keys() const
{
  if ( not cipher_.has_value() ) {
    return nullopt;
  }
  return cipher_->keys();
}

void Session::install_keys( const SessionKeys& keys )
{
  if ( cipher_.has_value() ) {
    return;
  }

  cipher_.emplace( keys );

  workers_.push_back( start_worker( "audio send", [this] { audio_send_loop(); } ) );
  workers_.push_back( start_worker( "audio receive", [this] { audio_receive_loop(); } ) );
  workers_.push_back( start_worker( "video send", [this] { video_send_loop(); } ) );
  workers_.push_back( start_worker( "video receive", [this] { video_receive_loop(); } ) );

  if ( devices_.audio_capture ) {
    devices_.audio_capture->start( [this]( AudioFrame&& frame ) { captured_audio_.put( move( frame ) ); } );
  }
  if ( devices_.video_capture ) {
    devices_.video_capture->start( [this]( VideoFrame&& frame ) { captured_video_.put( move( frame ) ); } );
  }

  cerr << "Session keys installed, media workers started\n";
}

atomic<uint64_t>& Session::sequence_counter( const Medium medium )
{
  switch ( medium ) {
    case Medium::Audio:
      return audio_sequence_;
    case Medium::Video:
      return video_sequence_;
    case Medium::Chat:
      return chat_sequence_;
  }

  throw runtime_error( "unknown Medium" );
}

void Session::count( unsigned int Statistics::*counter )
{
  lock_guard<mutex> lock { statistics_mutex_ };
  stats_.*counter += 1;
}

optional<string> Session::seal( const Medium medium, const string& payload )
{
  if ( not cipher_.has_value() ) {
    return nullopt;
  }

  MediaUnit unit;
  unit.medium = medium;
  unit.sequence = sequence_counter( medium )++;
  unit.session_nonce = cipher_->session_nonce();
  unit.packet_nonce = random_nonce();
  unit.source = self_;
  unit.timestamp = Timer::wall_clock_s();
  unit.payload = payload;

  string datagram = seal_unit( cipher_.value(), unit );
  if ( datagram.size() > MAX_DATAGRAM_SIZE ) {
    count( &Statistics::oversize );
    return nullopt;
  }

  count( &Statistics::sent );
  return datagram;
}

optional<MediaUnit> Session::accept( const string_view datagram, const Medium expected )
{
  if ( not cipher_.has_value() ) {
    return nullopt;
  }

  auto unit = open_unit( cipher_.value(), datagram );
  if ( not unit.has_value() ) {
    count( &Statistics::undecryptable );
    return nullopt;
  }

  if ( unit->session_nonce != cipher_->session_nonce() ) {
    count( &Statistics::foreign_nonce );
    return nullopt;
  }

  if ( unit->source == self_ ) {
    count( &Statistics::loopback );
    return nullopt;
  }

  if ( unit->medium != expected ) {
    count( &Statistics::rejected );
    return nullopt;
  }

  {
    lock_guard<mutex> lock { trackers_mutex_ };
    if ( not participants_.count( unit->source ) ) {
      count( &Statistics::rejected );
      return nullopt;
    }

    Tracker& tracker = trackers_[{ unit->source, unit->medium }];
    if ( not tracker.check_integrity( unit->sequence, unit->packet_nonce ) ) {
      count( &Statistics::rejected );
      return nullopt;
    }
    tracker.update( unit->sequence, unit->timestamp, unit->payload.size(), Timer::wall_clock_s() );
  }

  return unit;
}

void Session::set_enabled( const Medium medium, const bool enabled )
{
  switch ( medium ) {
    case Medium::Audio:
      audio_enabled_ = enabled;
      break;
    case Medium::Video:
      video_enabled_ = enabled;
      break;
    case Medium::Chat:
      break;
  }
}

bool Session::enabled( const Medium medium ) const
{
  switch ( medium ) {
    case Medium::Audio:
      return audio_enabled_;
    case Medium::Video:
      return video_enabled_;
    case Medium::Chat:
      return true;
  }

  return false;
}

vector<Feedback> Session::collect_feedback() const
{
  vector<Feedback> ret;

  lock_guard<mutex> lock { trackers_mutex_ };
  for ( const auto& [key, tracker] : trackers_ ) {
    const auto& [source, medium] = key;
    if ( medium != Medium::Video or source == self_ or not call_.includes( source ) ) {
      continue;
    }

    const auto rate = tracker.optimal_sending_rate();
    if ( rate.has_value() ) {
      ret.push_back( { self_, call_.master, rate.value() } );
    }
  }

  return ret;
}

StateAnnounce Session::state( const uint16_t key_port ) const
{
  return { self_, is_master(), key_port, audio_enabled_, video_enabled_ };
}

map<pair<string, Medium>, Tracker::Snapshot> Session::tracker_snapshots() const
{
  map<pair<string, Medium>, Tracker::Snapshot> ret;

  lock_guard<mutex> lock { trackers_mutex_ };
  for ( const auto& [key, tracker] : trackers_ ) {
    ret.emplace( key, tracker.snapshot() );
  }

  return ret;
}

Session::Statistics Session::statistics() const
{
  lock_guard<mutex> lock { statistics_mutex_ };
  return stats_;
}

size_t Session::playback_count() const
{
  lock_guard<mutex> lock { playbacks_mutex_ };
  return playbacks_.size();
}

shared_ptr<Session::Playback> Session::playback_for( const string& source )
{
  lock_guard<mutex> lock { playbacks_mutex_ };

  auto it = playbacks_.find( source );
  if ( it == playbacks_.end() ) {
    {
      lock_guard<mutex> participants_lock { trackers_mutex_ };
      if ( not participants_.count( source ) ) {
        return nullptr;
      }
    }

    it = playbacks_.emplace( source, make_shared<Playback>() ).first;
    Playback& playback = *it->second;
    playback.thread = start_worker( "playback " + source, [this, source, &playback] { playback_loop( source, playback ); } );
  }

  return it->second;
}

void Session::audio_send_loop()
{
  AudioEncoder encoder;

  while ( keep_running_ ) {
    auto frame = captured_audio_.take( milliseconds( WORKER_POLL_MS ) );
    if ( not frame.has_value() or not audio_enabled_ ) {
      continue;
    }

    const auto datagram = seal( Medium::Audio, encoder.encode( frame.value() ) );
    if ( datagram.has_value() ) {
      audio_socket_.sendto_ignore_errors( audio_group_, datagram.value() );
    }
  }
}

void Session::audio_receive_loop()
{
  received_datagram datagram { Address { "0.0.0.0", uint16_t( 0 ) }, {} };

  while ( keep_running_ ) {
    if ( not audio_socket_.recv( datagram ) ) {
      continue;
    }

    auto unit = accept( datagram.payload, Medium::Audio );
    if ( not unit.has_value() ) {
      continue;
    }

    const auto playback = playback_for( unit->source );
    if ( playback ) {
      playback->packets.put( move( unit->payload ) );
    }
  }
}

void Session::playback_loop( const string source, Playback& playback )
{
  AudioDecoder decoder;

  while ( keep_running_ and playback.keep_running ) {
    const auto packet = playback.packets.take( milliseconds( WORKER_POLL_MS ) );
    if ( not packet.has_value() ) {
      continue;
    }

    const AudioFrame frame = decoder.decode( packet.value() );
    if ( devices_.audio_playback ) {
      devices_.audio_playback->play( source, frame );
    }
  }
}

void Session::video_send_loop()
{
  uint64_t next_send_ns = 0;

  while ( keep_running_ ) {
    auto frame = captured_video_.take( milliseconds( WORKER_POLL_MS ) );
    if ( not frame.has_value() or not video_enabled_ ) {
      continue;
    }

    /* frames arriving faster than the current rate are dropped */
    const uint64_t now = Timer::timestamp_ns();
    if ( now < next_send_ns ) {
      continue;
    }
    next_send_ns = now + uint64_t( 1e9 / rate_controller_.clamped_rate() );

    const auto datagram = seal( Medium::Video, frame->data );
    if ( datagram.has_value() ) {
      video_socket_.sendto_ignore_errors( video_group_, datagram.value() );
    }
  }
}

void Session::video_receive_loop()
{
  received_datagram datagram { Address { "0.0.0.0", uint16_t( 0 ) }, {} };

  while ( keep_running_ ) {
    if ( not video_socket_.recv( datagram ) ) {
      continue;
    }

    auto unit = accept( datagram.payload, Medium::Video );
    if ( unit.has_value() and observer_ ) {
      observer_->on_video_frame( unit->source, VideoFrame { move( unit->payload ) } );
    }
  }
}

void Session::summary( ostream& out ) const
{
  out << "Call " << call_.id << ( is_master() ? " (master)" : "" ) << ":";
  out << " video_rate=" << fixed << setprecision( 1 ) << rate_controller_.rate();
  if ( rate_controller_.clr().has_value() ) {
    out << " clr=" << rate_controller_.clr().value();
  }

  const auto stats = statistics();
  out << " sent=" << stats.sent;
  if ( stats.undecryptable ) {
    out << " undecryptable=" << stats.undecryptable << "!";
  }
  if ( stats.foreign_nonce ) {
    out << " foreign_nonce=" << stats.foreign_nonce << "!";
  }
  if ( stats.rejected ) {
    out << " rejected=" << stats.rejected;
  }
  if ( stats.oversize ) {
    out << " oversize=" << stats.oversize << "!";
  }
  out << "\n";

  lock_guard<mutex> lock { trackers_mutex_ };
  for ( const auto& [key, tracker] : trackers_ ) {
    out << "  " << key.first << "/" << to_string( key.second ) << ": ";
    tracker.summary( out );
    out << "\n";
  }
}
