#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "messages.hh"

/* the client's copy of the server directory, and what each update means for the local call */
class DirectoryMirror
{
public:
  enum class SessionAction : uint8_t
  {
    None,
    Start,
    Update,
    End
  };

  struct Change
  {
    SessionAction action { SessionAction::None };
    CallInfo call {};
  };

private:
  std::string self_ {};
  bool joined_ {};

  std::map<std::string, UserStatus> users_ {};
  std::map<uint64_t, CallInfo> calls_ {};
  std::optional<uint64_t> current_call_ {};

public:
  /* false for a rejected join */
  bool apply( const JoinResponse& response );
  void apply( const UserUpdate& update );
  Change apply( const CallUpdate& update );

  bool joined() const { return joined_; }
  const std::string& self() const { return self_; }

  std::vector<UserInfo> users() const;
  std::vector<CallInfo> calls() const;
  std::optional<CallInfo> current_call() const;
};
