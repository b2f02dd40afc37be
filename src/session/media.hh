#pragma once

#include <functional>
#include <string>
#include <vector>

/* 20 ms of mono float PCM at 48 kHz */
struct AudioFrame
{
  static constexpr unsigned int SAMPLE_RATE = 48000;
  static constexpr unsigned int NUM_SAMPLES = 960;

  std::vector<float> samples {};
};

/* one compressed picture (e.g. JPEG), opaque to the session */
struct VideoFrame
{
  std::string data {};
};

/* microphone; delivers frames from its own thread until stopped */
class AudioCapture
{
public:
  using Sink = std::function<void( AudioFrame&& )>;

  virtual void start( const Sink& sink ) = 0;
  virtual void stop() = 0;
  virtual ~AudioCapture() = default;
};

/* camera */
class VideoCapture
{
public:
  using Sink = std::function<void( VideoFrame&& )>;

  virtual void start( const Sink& sink ) = 0;
  virtual void stop() = 0;
  virtual ~VideoCapture() = default;
};

/* speaker; called from one playback thread per remote participant */
class AudioPlayback
{
public:
  virtual void play( const std::string& source, const AudioFrame& frame ) = 0;
  virtual void stop() = 0;
  virtual ~AudioPlayback() = default;
};
