#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tunnel/attempt.hpp"

namespace hookrelay {

// JSON text frames exchanged with the remote dispatcher. Every frame is an
// object whose "event" member names its kind.
enum class FrameKind {
  Hello,
  Welcome,
  Ping,
  Pong,
  Attempt,
  AttemptResult,
  Control,
  Bye,
  Unknown
};

// Reads "event" (or legacy "type"). Unknown for anything unrecognised.
FrameKind PeekFrameKind(const boost::json::value &jv);

struct HelloFrame {
  std::string session_id;
  std::string token;
  std::string client_version;
  std::vector<std::string> capabilities;
  std::string source_id;
  std::vector<std::string> connection_ids;
};

struct WelcomeFrame {
  std::string session_id;
  std::optional<int> heartbeat_interval_ms;
  std::string notice;
  // Non-empty when the dispatcher refused the session, e.g. "invalid_token".
  std::string error;
};

struct PingFrame {
  std::uint64_t token{0};
};

struct PongFrame {
  std::uint64_t token{0};
};

// Frames announcing more parts than this are protocol errors.
inline constexpr int kMaxAttemptParts = 4096;

struct FramePart {
  int index{0};
  int total{1};
};

struct AttemptFrame {
  InboundAttempt attempt;
  // Set when the dispatcher split one attempt across several frames; only
  // the first part carries request metadata, every part carries body bytes.
  std::optional<FramePart> part;
};

struct AttemptResultFrame {
  AttemptResult result;
};

enum class ControlKind { RateLimit, SessionRevoked, Drain, Unknown };

struct ControlFrame {
  ControlKind kind{ControlKind::Unknown};
  std::string raw_kind;
  std::string message;
};

struct ByeFrame {
  std::string reason;
};

void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const HelloFrame &hello);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const WelcomeFrame &welcome);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const PingFrame &ping);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const PongFrame &pong);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const AttemptFrame &frame);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const AttemptResultFrame &frame);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const ControlFrame &control);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const ByeFrame &bye);

HelloFrame tag_invoke(const boost::json::value_to_tag<HelloFrame> &,
                      const boost::json::value &jv);
WelcomeFrame tag_invoke(const boost::json::value_to_tag<WelcomeFrame> &,
                        const boost::json::value &jv);
PingFrame tag_invoke(const boost::json::value_to_tag<PingFrame> &,
                     const boost::json::value &jv);
PongFrame tag_invoke(const boost::json::value_to_tag<PongFrame> &,
                     const boost::json::value &jv);
AttemptFrame tag_invoke(const boost::json::value_to_tag<AttemptFrame> &,
                        const boost::json::value &jv);
AttemptResultFrame
tag_invoke(const boost::json::value_to_tag<AttemptResultFrame> &,
           const boost::json::value &jv);
ControlFrame tag_invoke(const boost::json::value_to_tag<ControlFrame> &,
                        const boost::json::value &jv);
ByeFrame tag_invoke(const boost::json::value_to_tag<ByeFrame> &,
                    const boost::json::value &jv);

} // namespace hookrelay
