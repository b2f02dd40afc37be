#include "console_presentation.hh"

#include <iomanip>

using namespace std;

ConsolePresentation::ConsolePresentation( ostream& out, const bool auto_answer )
  : out_( out )
  , auto_answer_( auto_answer )
{}

void ConsolePresentation::on_directory( const vector<UserInfo>& users )
{
  out_ << "Directory:";
  if ( users.empty() ) {
    out_ << " (nobody else)";
  }
  for ( const auto& user : users ) {
    out_ << " " << user.name << " (" << to_string( user.status ) << ")";
  }
  out_ << endl;
}

void ConsolePresentation::on_calls( const vector<CallInfo>& calls )
{
  out_ << "Calls:";
  if ( calls.empty() ) {
    out_ << " (none)";
  }
  for ( const auto& call : calls ) {
    out_ << " #" << call.id << "[";
    for ( size_t i = 0; i < call.participants.size(); i++ ) {
      out_ << ( i ? " " : "" ) << call.participants[i] << ( call.participants[i] == call.master ? "*" : "" );
    }
    out_ << "]";
  }
  out_ << endl;
}

void ConsolePresentation::on_call_prompt( const string& caller )
{
  if ( auto_answer_ and responder_ ) {
    out_ << "Answering call from " << caller << endl;
    responder_( UiAnswer { caller, true } );
    return;
  }

  out_ << "Incoming call from " << caller << " (answer " << caller << " yes|no)" << endl;
}

void ConsolePresentation::on_banner( const string& text, const chrono::milliseconds )
{
  out_ << "*** " << text << " ***" << endl;
}

void ConsolePresentation::on_chat( const string& source, const string& text )
{
  out_ << "<" << source << "> " << text << endl;
}

void ConsolePresentation::on_call_start( const CallInfo& call )
{
  current_call_ = to_string( call.id );
  out_ << "Call #" << call.id << " started (master " << call.master << ")" << endl;
}

void ConsolePresentation::on_call_end()
{
  out_ << "Call #" << current_call_ << " ended" << endl;
  current_call_.clear();

  const lock_guard<mutex> lock { frames_mutex_ };
  video_frames_.clear();
}

void ConsolePresentation::on_statistics( const TrackerSnapshots& snapshots )
{
  for ( const auto& [key, snapshot] : snapshots ) {
    out_ << "  " << key.first << "/" << to_string( key.second ) << fixed << setprecision( 1 )
         << ": latency=" << snapshot.latency_s * 1000 << "ms fps=" << snapshot.framerate
         << " kbps=" << snapshot.bitrate / 1000 << setprecision( 3 ) << " drop=" << snapshot.framedrop;
    if ( snapshot.rejected_replay or snapshot.rejected_window ) {
      out_ << " rejected=" << snapshot.rejected_replay + snapshot.rejected_window;
    }
    out_ << "\n";
  }
  out_ << defaultfloat << flush;
}

void ConsolePresentation::on_video_frame( const string& source, const VideoFrame& )
{
  const lock_guard<mutex> lock { frames_mutex_ };
  video_frames_[source]++;
}

void ConsolePresentation::summary( ostream& out ) const
{
  const lock_guard<mutex> lock { frames_mutex_ };
  if ( video_frames_.empty() ) {
    return;
  }

  out << "Video frames shown:";
  for ( const auto& [source, count] : video_frames_ ) {
    out << " " << source << "=" << count;
  }
  out << "\n";
}

void ConsolePresentation::reset_summary()
{
  const lock_guard<mutex> lock { frames_mutex_ };
  for ( auto& [source, count] : video_frames_ ) {
    count = 0;
  }
}
