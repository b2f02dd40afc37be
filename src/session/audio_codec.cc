#include "audio_codec.hh"
#include "exception.hh"

#include <stdexcept>

using namespace std;

static int opus_check( const int retval )
{
  if ( retval < 0 ) {
    throw runtime_error( "Opus error: " + string( opus_strerror( retval ) ) );
  }

  return retval;
}

void AudioEncoder::encoder_deleter::operator()( OpusEncoder* x ) const
{
  opus_encoder_destroy( x );
}

AudioEncoder::AudioEncoder( const int bit_rate )
{
  int out;

  encoder_.reset( notnull( "opus_encoder_create",
                           opus_encoder_create( AudioFrame::SAMPLE_RATE, 1, OPUS_APPLICATION_VOIP, &out ) ) );
  opus_check( out );

  opus_check( opus_encoder_ctl( encoder_.get(), OPUS_SET_BITRATE( bit_rate ) ) );

  opus_check( opus_encoder_ctl( encoder_.get(), OPUS_GET_BITRATE( &out ) ) );
  if ( out != bit_rate ) {
    throw runtime_error( "bit rate mismatch" );
  }
}

string AudioEncoder::encode( const AudioFrame& frame )
{
  if ( frame.samples.size() != AudioFrame::NUM_SAMPLES ) {
    throw runtime_error( "AudioEncoder: expected " + to_string( AudioFrame::NUM_SAMPLES ) + " samples, got "
                         + to_string( frame.samples.size() ) );
  }

  string packet( MAX_PACKET_SIZE, '\0' );
  const size_t bytes_written = opus_check( opus_encode_float( encoder_.get(),
                                                              frame.samples.data(),
                                                              frame.samples.size(),
                                                              reinterpret_cast<unsigned char*>( packet.data() ),
                                                              packet.size() ) );
  packet.resize( bytes_written );
  return packet;
}

void AudioDecoder::decoder_deleter::operator()( OpusDecoder* x ) const
{
  opus_decoder_destroy( x );
}

AudioDecoder::AudioDecoder()
{
  int out;

  decoder_.reset( notnull( "opus_decoder_create", opus_decoder_create( AudioFrame::SAMPLE_RATE, 1, &out ) ) );
  opus_check( out );
}

AudioFrame AudioDecoder::decode( const string_view packet )
{
  AudioFrame frame;
  frame.samples.resize( AudioFrame::NUM_SAMPLES );

  const size_t samples_written = opus_check( opus_decode_float( decoder_.get(),
                                                                reinterpret_cast<const unsigned char*>( packet.data() ),
                                                                packet.size(),
                                                                frame.samples.data(),
                                                                frame.samples.size(),
                                                                0 ) );
  frame.samples.resize( samples_written );
  return frame;
}
