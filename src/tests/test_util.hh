#pragma once

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

inline void expect( const bool condition, const std::string& what )
{
  if ( not condition ) {
    throw std::runtime_error( "expectation failed: " + what );
  }
}

template<typename A, typename B>
void expect_eq( const A& actual, const B& expected, const std::string& what )
{
  if ( not( actual == expected ) ) {
    std::ostringstream ss;
    ss << "expectation failed: " << what << " (got " << actual << ", expected " << expected << ")";
    throw std::runtime_error( ss.str() );
  }
}

inline void expect_near( const double actual, const double expected, const double tolerance, const std::string& what )
{
  if ( not( std::fabs( actual - expected ) <= tolerance ) ) {
    std::ostringstream ss;
    ss << "expectation failed: " << what << " (got " << actual << ", expected " << expected << " +/- " << tolerance
       << ")";
    throw std::runtime_error( ss.str() );
  }
}

/* runs `body` and requires it to throw E */
template<typename E, typename F>
void expect_throws( F&& body, const std::string& what )
{
  try {
    body();
  } catch ( const E& ) {
    return;
  }
  throw std::runtime_error( "expectation failed: " + what + " (no exception)" );
}
