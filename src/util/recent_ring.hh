#pragma once

#include <algorithm>
#include <array>
#include <cstddef>

/* fixed-capacity ring remembering the most recent N values */
template<typename T, size_t N>
class RecentRing
{
  std::array<T, N> elements_ {};
  size_t next_ {};
  size_t num_stored_ {};

public:
  void push( const T& value )
  {
    elements_[next_] = value;
    next_ = ( next_ + 1 ) % N;
    num_stored_ = std::min( num_stored_ + 1, N );
  }

  bool contains( const T& value ) const
  {
    return std::find( elements_.begin(), elements_.begin() + num_stored_, value ) != elements_.begin() + num_stored_;
  }

  size_t size() const { return num_stored_; }
  static constexpr size_t capacity() { return N; }
};
