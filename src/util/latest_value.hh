#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

/* depth-1 channel: the producer overwrites, the consumer takes the newest value once */
template<typename T>
class LatestValue
{
  mutable std::mutex mutex_ {};
  std::condition_variable updated_ {};
  std::optional<T> value_ {};
  unsigned int overwritten_ {};

public:
  void put( T value )
  {
    {
      std::lock_guard<std::mutex> lock { mutex_ };
      if ( value_.has_value() ) {
        overwritten_++;
      }
      value_ = std::move( value );
    }
    updated_.notify_one();
  }

  std::optional<T> try_take()
  {
    std::lock_guard<std::mutex> lock { mutex_ };
    std::optional<T> ret;
    ret.swap( value_ );
    return ret;
  }

  std::optional<T> take( const std::chrono::milliseconds timeout )
  {
    std::unique_lock<std::mutex> lock { mutex_ };
    updated_.wait_for( lock, timeout, [&] { return value_.has_value(); } );
    std::optional<T> ret;
    ret.swap( value_ );
    return ret;
  }

  unsigned int overwritten() const
  {
    std::lock_guard<std::mutex> lock { mutex_ };
    return overwritten_;
  }
};
