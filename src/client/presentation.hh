#pragma once

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "messages.hh"
#include "session.hh"
#include "tracker.hh"

/* everything the client shows; video frames arrive on session worker threads, the rest on the event loop */
class Presentation : public SessionObserver
{
public:
  static constexpr std::chrono::milliseconds BANNER_DISMISS { 3000 };

  using TrackerSnapshots = std::map<std::pair<std::string, Medium>, Tracker::Snapshot>;

  virtual void on_directory( const std::vector<UserInfo>& users ) = 0;
  virtual void on_calls( const std::vector<CallInfo>& calls ) = 0;
  virtual void on_call_prompt( const std::string& caller ) = 0;
  virtual void on_banner( const std::string& text, const std::chrono::milliseconds dismiss_after ) = 0;
  virtual void on_chat( const std::string& source, const std::string& text ) = 0;
  virtual void on_call_start( const CallInfo& call ) = 0;
  virtual void on_call_end() = 0;
  virtual void on_statistics( const TrackerSnapshots& snapshots ) = 0;
};
