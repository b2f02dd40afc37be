#pragma once

#include <cmath>

template<typename T1, typename T2>
void ewma_update( T1& variable, const T2& new_value, const double ALPHA )
{
  variable = ALPHA * new_value + ( 1 - ALPHA ) * variable;
}

/* the longer since the last update, the more the new sample counts */
inline double exp_weight( const double delta_t_s )
{
  return 1.0 - std::exp( -delta_t_s );
}
