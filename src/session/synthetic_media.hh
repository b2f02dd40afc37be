#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "media.hh"
#include "summarize.hh"

/* stand-in devices for hosts without a microphone, camera or speaker */

/* a sine tone (silence at frequency 0) paced at one frame per 20 ms */
class ToneCapture : public AudioCapture
{
  double frequency_;
  std::atomic<bool> running_ {};
  std::thread thread_ {};

public:
  explicit ToneCapture( const double frequency = 440.0 );
  ~ToneCapture() override;

  void start( const Sink& sink ) override;
  void stop() override;
};

/* numbered test-pattern frames of a fixed size */
class TestPatternCapture : public VideoCapture
{
  unsigned int frames_per_second_;
  size_t frame_size_;
  std::atomic<bool> running_ {};
  std::thread thread_ {};

public:
  TestPatternCapture( const unsigned int frames_per_second = 30, const size_t frame_size = 8192 );
  ~TestPatternCapture() override;

  void start( const Sink& sink ) override;
  void stop() override;
};

/* discards audio, counting frames and peak level per source */
class CountingPlayback : public AudioPlayback, public Summarizable
{
  struct Level
  {
    unsigned int frames;
    float peak;
  };

  mutable std::mutex mutex_ {};
  std::map<std::string, Level> levels_ {};

public:
  void play( const std::string& source, const AudioFrame& frame ) override;
  void stop() override {}

  unsigned int frames_from( const std::string& source ) const;

  void summary( std::ostream& out ) const override;
  void reset_summary() override;
};
