#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <opus/opus.h>

#include "media.hh"

class AudioEncoder
{
  struct encoder_deleter
  {
    void operator()( OpusEncoder* x ) const;
  };

  std::unique_ptr<OpusEncoder, encoder_deleter> encoder_ {};

public:
  static constexpr int DEFAULT_BIT_RATE = 32000;
  static constexpr size_t MAX_PACKET_SIZE = 1500;

  explicit AudioEncoder( const int bit_rate = DEFAULT_BIT_RATE );

  std::string encode( const AudioFrame& frame );
};

class AudioDecoder
{
  struct decoder_deleter
  {
    void operator()( OpusDecoder* x ) const;
  };

  std::unique_ptr<OpusDecoder, decoder_deleter> decoder_ {};

public:
  AudioDecoder();

  AudioFrame decode( const std::string_view packet );
};
