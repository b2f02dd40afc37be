#include "synthetic_media.hh"

#include <cmath>
#include <stdexcept>

using namespace std;
using namespace std::chrono;

ToneCapture::ToneCapture( const double frequency )
  : frequency_( frequency )
{}

ToneCapture::~ToneCapture()
{
  stop();
}

void ToneCapture::start( const Sink& sink )
{
  stop();
  running_ = true;

  thread_ = thread( [this, sink] {
    const auto frame_duration = microseconds( 1'000'000 * AudioFrame::NUM_SAMPLES / AudioFrame::SAMPLE_RATE );
    auto next_frame = steady_clock::now();
    uint64_t sample_index = 0;

    while ( running_ ) {
      AudioFrame frame;
      frame.samples.resize( AudioFrame::NUM_SAMPLES );
      for ( auto& sample : frame.samples ) {
        sample = 0.25 * sin( 2 * M_PI * frequency_ * sample_index++ / AudioFrame::SAMPLE_RATE );
      }
      sink( move( frame ) );

      next_frame += frame_duration;
      this_thread::sleep_until( next_frame );
    }
  } );
}

void ToneCapture::stop()
{
  running_ = false;
  if ( thread_.joinable() ) {
    thread_.join();
  }
}

TestPatternCapture::TestPatternCapture( const unsigned int frames_per_second, const size_t frame_size )
  : frames_per_second_( frames_per_second )
  , frame_size_( frame_size )
{
  if ( frames_per_second_ == 0 ) {
    throw runtime_error( "TestPatternCapture: frames_per_second must be positive" );
  }
}

TestPatternCapture::~TestPatternCapture()
{
  stop();
}

void TestPatternCapture::start( const Sink& sink )
{
  stop();
  running_ = true;

  thread_ = thread( [this, sink] {
    const auto frame_duration = microseconds( 1'000'000 / frames_per_second_ );
    auto next_frame = steady_clock::now();
    uint64_t frame_number = 0;

    while ( running_ ) {
      VideoFrame frame;
      frame.data = "frame " + to_string( frame_number ) + "\n";
      frame.data.resize( max( frame_size_, frame.data.size() ), char( 'A' + frame_number % 26 ) );
      frame_number++;
      sink( move( frame ) );

      next_frame += frame_duration;
      this_thread::sleep_until( next_frame );
    }
  } );
}

void TestPatternCapture::stop()
{
  running_ = false;
  if ( thread_.joinable() ) {
    thread_.join();
  }
}

void CountingPlayback::play( const string& source, const AudioFrame& frame )
{
  float peak = 0;
  for ( const float sample : frame.samples ) {
    peak = max( peak, fabs( sample ) );
  }

  const lock_guard<mutex> lock { mutex_ };
  auto& level = levels_[source];
  level.frames++;
  level.peak = max( level.peak, peak );
}

unsigned int CountingPlayback::frames_from( const string& source ) const
{
  const lock_guard<mutex> lock { mutex_ };
  const auto it = levels_.find( source );
  return it == levels_.end() ? 0 : it->second.frames;
}

void CountingPlayback::summary( ostream& out ) const
{
  const lock_guard<mutex> lock { mutex_ };
  if ( levels_.empty() ) {
    return;
  }

  out << "Playback:";
  for ( const auto& [source, level] : levels_ ) {
    out << " " << source << "=" << level.frames << " frames (peak " << level.peak << ")";
    if ( level.frames and level.peak == 0 ) {
      out << " silent!";
    }
  }
  out << "\n";
}

void CountingPlayback::reset_summary()
{
  const lock_guard<mutex> lock { mutex_ };
  for ( auto& [source, level] : levels_ ) {
    level = {};
  }
}
