#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

#include "presentation.hh"
#include "summarize.hh"

/* terminal rendition of the directory and the current call */
class ConsolePresentation : public Presentation, public Summarizable
{
public:
  using Responder = std::function<void( const Message& )>;

private:
  std::ostream& out_;
  bool auto_answer_;
  Responder responder_ {};

  std::string current_call_ {};

  mutable std::mutex frames_mutex_ {};
  std::map<std::string, unsigned int> video_frames_ {};

public:
  /* with auto_answer, every call prompt is accepted through the responder */
  ConsolePresentation( std::ostream& out, const bool auto_answer );

  void set_responder( const Responder& responder ) { responder_ = responder; }

  void on_directory( const std::vector<UserInfo>& users ) override;
  void on_calls( const std::vector<CallInfo>& calls ) override;
  void on_call_prompt( const std::string& caller ) override;
  void on_banner( const std::string& text, const std::chrono::milliseconds dismiss_after ) override;
  void on_chat( const std::string& source, const std::string& text ) override;
  void on_call_start( const CallInfo& call ) override;
  void on_call_end() override;
  void on_statistics( const TrackerSnapshots& snapshots ) override;

  void on_video_frame( const std::string& source, const VideoFrame& frame ) override;

  void summary( std::ostream& out ) const override;
  void reset_summary() override;
};
