#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "address.hh"
#include "crypto.hh"
#include "framing.hh"
#include "latest_value.hh"
#include "media.hh"
#include "messages.hh"
#include "rate_controller.hh"
#include "socket.hh"
#include "summarize.hh"
#include "tracker.hh"

/* receives decoded remote media on the session's worker threads */
class SessionObserver
{
public:
  virtual void on_video_frame( const std::string& source, const VideoFrame& frame ) = 0;
  virtual ~SessionObserver() = default;
};

struct MediaDevices
{
  std::shared_ptr<AudioCapture> audio_capture {};
  std::shared_ptr<VideoCapture> video_capture {};
  std::shared_ptr<AudioPlayback> audio_playback {};
};

/* one participant's view of an active call: key material, multicast sockets, media workers, statistics */
class Session : public Summarizable
{
public:
  static constexpr uint16_t CONTENT_PORT = 5060;
  static constexpr uint16_t CONTROL_PORT = 5061;
  static constexpr unsigned int WORKER_POLL_MS = 1000;
  static constexpr size_t MAX_DATAGRAM_SIZE = 65000;

  struct Ports
  {
    uint16_t content { CONTENT_PORT };
    uint16_t control { CONTROL_PORT };
  };

  struct Statistics
  {
    unsigned int undecryptable, foreign_nonce, loopback, rejected, oversize, sent;
  };

private:
  std::string self_;
  CallInfo call_;
  MediaDevices devices_;
  SessionObserver* observer_;

  Address audio_group_, video_group_, chat_group_, control_group_;
  UDPSocket audio_socket_ {}, video_socket_ {};
  std::shared_ptr<UDPSocket> chat_socket_, control_socket_;

  std::optional<CipherSession> cipher_ {};

  std::atomic<uint64_t> audio_sequence_ {}, video_sequence_ {}, chat_sequence_ {};
  std::atomic<bool> audio_enabled_ { true }, video_enabled_ { true };

  RateController rate_controller_ {};

  /* guards the trackers and the participant set the receive workers check against */
  mutable std::mutex trackers_mutex_ {};
  std::map<std::pair<std::string, Medium>, Tracker> trackers_ {};
  std::set<std::string> participants_ {};

  LatestValue<AudioFrame> captured_audio_ {};
  LatestValue<VideoFrame> captured_video_ {};

  std::atomic<bool> keep_running_ { true };
  std::vector<std::thread> workers_ {};

  struct Playback
  {
    LatestValue<std::string> packets {};
    std::atomic<bool> keep_running { true };
    std::thread thread {};
  };

  mutable std::mutex playbacks_mutex_ {};
  std::map<std::string, std::shared_ptr<Playback>> playbacks_ {};

  mutable std::mutex statistics_mutex_ {};
  Statistics stats_ {};

  static Address group_address( const std::string& group, const uint16_t port );
  static void join_group( UDPSocket& socket, const Address& group );

  std::atomic<uint64_t>& sequence_counter( const Medium medium );
  void count( unsigned int Statistics::*counter );

  void audio_send_loop();
  void audio_receive_loop();
  void video_send_loop();
  void video_receive_loop();
  void playback_loop( const std::string source, Playback& playback );

  /* nullptr once the source has left the call */
  std::shared_ptr<Playback> playback_for( const std::string& source );
  void forget_participant( const std::string& name );

  void stop();

public:
  Session( const std::string& self,
           const CallInfo& call,
           const MediaDevices& devices,
           SessionObserver* observer,
           const Ports& ports );

  /* stops the workers and devices, then releases the sockets */
  ~Session();

  const std::string& self() const { return self_; }
  const CallInfo& call() const { return call_; }
  bool is_master() const { return call_.master == self_; }

  /* roster or master change for the same call; returns true if this participant just became master */
  bool update_call( const CallInfo& call );

  bool has_keys() const { return cipher_.has_value(); }
  std::optional<SessionKeys> keys() const;

  /* adopts key material (once) and starts the media workers */
  void install_keys( const SessionKeys& keys );

  /* event-loop side of the chat and control groups */
  std::shared_ptr<UDPSocket> chat_socket() { return chat_socket_; }
  std::shared_ptr<UDPSocket> control_socket() { return control_socket_; }
  const Address& chat_destination() const { return chat_group_; }
  const Address& control_destination() const { return control_group_; }

  /* sealed session/content datagram, or nullopt before keys arrive */
  std::optional<std::string> seal( const Medium medium, const std::string& payload );

  /* full receive path: decrypt, drop foreign or looped-back units, integrity check, statistics */
  std::optional<MediaUnit> accept( const std::string_view datagram, const Medium expected );

  void set_enabled( const Medium medium, const bool enabled );
  bool enabled( const Medium medium ) const;

  RateController& rate_controller() { return rate_controller_; }

  /* one report per remote participant whose video latency is known, addressed to the master */
  std::vector<Feedback> collect_feedback() const;

  StateAnnounce state( const uint16_t key_port ) const;

  std::map<std::pair<std::string, Medium>, Tracker::Snapshot> tracker_snapshots() const;
  Statistics statistics() const;
  size_t playback_count() const;

  void summary( std::ostream& out ) const override;

  Session( const Session& other ) = delete;
  Session& operator=( const Session& other ) = delete;
};
