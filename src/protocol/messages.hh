#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <json/json.h>

/* wire protocol: one JSON object per message, keyed by "type" / "subtype" (and "mode" for session control) */

enum class UserStatus : uint8_t
{
  Available,
  InCall
};

std::string_view to_string( const UserStatus status );
std::optional<UserStatus> user_status_from_string( const std::string_view str );

struct UserInfo
{
  std::string name {};
  UserStatus status { UserStatus::Available };

  bool operator==( const UserInfo& other ) const { return name == other.name and status == other.status; }
};

struct CallAddresses
{
  std::string audio {}, video {}, chat {};

  bool operator==( const CallAddresses& other ) const
  {
    return audio == other.audio and video == other.video and chat == other.chat;
  }
};

struct CallInfo
{
  uint64_t id {};
  std::string master {};
  std::vector<std::string> participants {};
  CallAddresses addresses {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );

  bool includes( const std::string_view name ) const;
};

/* client -> server */

struct JoinRequest
{
  static constexpr const char* type = "join";
  static constexpr const char* subtype = "request";

  std::string name {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct CallRequest
{
  static constexpr const char* type = "call";
  static constexpr const char* subtype = "request";

  std::string callee {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

/* sent by the callee to the server, and forwarded by the server to the caller */
struct CalleeResponse
{
  static constexpr const char* type = "call";
  static constexpr const char* subtype = "callee_response";

  std::string caller {}, callee {};
  bool accept {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct SessionLeave
{
  static constexpr const char* type = "session";
  static constexpr const char* subtype = "leave";

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& ) { return true; }
};

/* server -> client */

struct JoinResponse
{
  static constexpr const char* type = "join";
  static constexpr const char* subtype = "response";

  bool ok {};
  std::string name {};
  std::vector<UserInfo> users {};
  std::vector<CallInfo> calls {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct UserUpdate
{
  static constexpr const char* type = "user_update";

  enum class Kind : uint8_t
  {
    Join,
    Leave,
    Status
  };

  Kind kind { Kind::Join };
  std::string name {};
  UserStatus status { UserStatus::Available };

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct CallParticipate
{
  static constexpr const char* type = "call";
  static constexpr const char* subtype = "participate";

  std::string caller {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

/* the requested callee cannot take the call */
struct CallUnavailable
{
  static constexpr const char* type = "call";
  static constexpr const char* subtype = "response";

  std::string callee {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct CallUpdate
{
  static constexpr const char* type = "call_update";

  enum class Kind : uint8_t
  {
    CallAdd,
    CallRemove,
    UserJoin,
    UserLeave
  };

  Kind kind { Kind::CallAdd };
  std::string master {};
  std::string name {};
  CallInfo info {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

/* call channels (multicast content/control, key-exchange stream) */

struct SessionContent
{
  static constexpr const char* type = "session";
  static constexpr const char* subtype = "content";

  std::string payload {}; /* base64 of the encrypted media unit */

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct PubKey
{
  static constexpr const char* mode = "pubkey";

  std::string source {};
  std::string public_key_pem {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct KeyInfo
{
  static constexpr const char* mode = "key_info";

  std::string sealed_key {}; /* RSA-OAEP of {key, session_nonce}, base64 */
  std::string iv {};         /* base64 */

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct Feedback
{
  static constexpr const char* mode = "feedback";

  std::string source {}, target {};
  unsigned int rate {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

/* periodic announcement of a participant's session state */
struct StateAnnounce
{
  static constexpr const char* mode = "state";

  std::string source {};
  bool master {};
  uint16_t key_port {}; /* 0 unless a key-distribution listener is open */
  bool audio_enabled { true }, video_enabled { true };

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

/* presentation -> client ingress */

struct UiJoin
{
  static constexpr const char* subtype = "join";

  std::string name {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct UiCall
{
  static constexpr const char* subtype = "call";

  std::string callee {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct UiAnswer
{
  static constexpr const char* subtype = "answer";

  std::string caller {};
  bool accept {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

struct UiLeave
{
  static constexpr const char* subtype = "leave";

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& ) { return true; }
};

struct UiChat
{
  static constexpr const char* subtype = "chat";

  std::string text {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

enum class Medium : uint8_t
{
  Audio,
  Video,
  Chat
};

std::string_view to_string( const Medium medium );
std::optional<Medium> medium_from_string( const std::string_view str );

struct UiToggle
{
  static constexpr const char* subtype = "toggle";

  Medium medium { Medium::Audio };
  bool enabled {};

  void to_json( Json::Value& root ) const;
  bool parse( const Json::Value& root );
};

using Message = std::variant<JoinRequest,
                             CallRequest,
                             CalleeResponse,
                             SessionLeave,
                             JoinResponse,
                             UserUpdate,
                             CallParticipate,
                             CallUnavailable,
                             CallUpdate,
                             SessionContent,
                             PubKey,
                             KeyInfo,
                             Feedback,
                             StateAnnounce,
                             UiJoin,
                             UiCall,
                             UiAnswer,
                             UiLeave,
                             UiChat,
                             UiToggle>;

Json::Value to_json( const Message& message );

/* compact single-line JSON */
std::string serialize( const Message& message );

/* nullopt for unknown categories or missing/mistyped fields */
std::optional<Message> parse_message( const Json::Value& root );

/* parses one JSON text, e.g. a whole datagram */
std::optional<Message> decode_message( const std::string_view text );

/* helper for std::visit with a set of lambdas */
template<class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};
template<class... Ts>
overloaded( Ts... ) -> overloaded<Ts...>;
