#pragma once

#include <string>
#include <string_view>

std::string base64_encode( const std::string_view input );

/* false on malformed input (bad alphabet or length) */
bool base64_decode( const std::string_view input, std::string& output );
