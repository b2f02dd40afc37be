#include "json_stream.hh"

#include <memory>

using namespace std;

void JsonStreamDecoder::reset_scan()
{
  scan_pos_ = 0;
  depth_ = 0;
  in_string_ = false;
  escaped_ = false;
}

void JsonStreamDecoder::push( const string_view data )
{
  buffer_.append( data );
}

optional<Json::Value> JsonStreamDecoder::pop()
{
  while ( scan_pos_ < buffer_.size() ) {
    /* skip anything between objects */
    if ( depth_ == 0 ) {
      const auto start = buffer_.find( '{', scan_pos_ );
      if ( start == string::npos ) {
        buffer_.clear();
        reset_scan();
        return nullopt;
      }
      buffer_.erase( 0, start );
      scan_pos_ = 0;
    }

    const char ch = buffer_[scan_pos_++];

    if ( in_string_ ) {
      if ( escaped_ ) {
        escaped_ = false;
      } else if ( ch == '\\' ) {
        escaped_ = true;
      } else if ( ch == '"' ) {
        in_string_ = false;
      }
      continue;
    }

    if ( ch == '"' ) {
      in_string_ = true;
    } else if ( ch == '{' ) {
      depth_++;
    } else if ( ch == '}' ) {
      depth_--;
      if ( depth_ == 0 ) {
        const string object = buffer_.substr( 0, scan_pos_ );
        buffer_.erase( 0, scan_pos_ );
        reset_scan();

        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        const unique_ptr<Json::CharReader> reader { builder.newCharReader() };

        Json::Value root;
        string errors;
        if ( reader->parse( object.data(), object.data() + object.size(), &root, &errors ) ) {
          return root;
        }

        malformed_++;
      }
    }
  }

  if ( buffer_.size() > MAX_OBJECT_SIZE ) {
    malformed_++;
    buffer_.clear();
    reset_scan();
  }

  return nullopt;
}
