#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "crypto.hh"
#include "messages.hh"

/* one audio packet, video frame or chat line as carried on a call's multicast groups */
struct MediaUnit
{
  Medium medium { Medium::Audio };
  uint64_t sequence {};
  uint64_t session_nonce {};
  uint64_t packet_nonce {};
  std::string source {};
  double timestamp {}; /* sender wall clock, seconds */
  std::string payload {};
};

/* encrypts the unit and wraps it in a session/content message, ready to send as one datagram */
std::string seal_unit( const CipherSession& cipher, const MediaUnit& unit );

enum class OpenError : uint8_t
{
  NotContent,
  Undecryptable,
  Malformed
};

/* the inverse of seal_unit; the caller still checks nonce, source and sequence */
std::optional<MediaUnit> open_unit( const CipherSession& cipher,
                                    const std::string_view datagram,
                                    OpenError* error = nullptr );
