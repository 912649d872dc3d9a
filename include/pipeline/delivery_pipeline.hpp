#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "conf/listen_config.hpp"
#include "control_plane/control_plane_client.hpp"
#include "customio/console_output.hpp"
#include "pipeline/local_dispatcher.hpp"
#include "tunnel/route_table.hpp"
#include "ui/event_bus.hpp"
#include "util/io_context_manager.hpp"
#include "util/io_monad.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

// Where finished results go first. Implemented by the transport; must not
// block. Errors are LISTEN::NOT_OPEN or LISTEN::OVERLOADED.
class IResultSender {
public:
  virtual ~IResultSender() = default;
  virtual monad::MyVoidResult SendResult(const AttemptResult &result) = 0;
};

// Receives reassembled attempts from the transport, in socket order.
class IAttemptSink {
public:
  virtual ~IAttemptSink() = default;
  virtual void OnAttempt(InboundAttempt attempt) = 0;
  // False while the pending queue is full; the transport then stops reading.
  virtual bool Ready() const = 0;
  // Runs `resume` once (on the io_context) when Ready() turns true again.
  virtual void WhenReady(std::function<void()> resume) = 0;
  // Finishes everything already accepted, then calls `done(clean)`.
  virtual void Drain(std::chrono::milliseconds deadline,
                     std::function<void(bool clean)> done) = 0;
  // Accepts attempts again after a completed Drain().
  virtual void Resume() = 0;
};

struct PipelineStats {
  std::size_t in_flight{0};
  std::size_t pending{0};
  std::uint64_t completed{0};
  std::uint64_t unknown_route{0};
  std::uint64_t sent{0};
  std::uint64_t fallback{0};
  std::uint64_t unreported{0};
};

// Replays attempts against the local target with at most
// max_concurrent_attempts calls in flight and pending_queue_capacity more
// queued. Every accepted attempt yields exactly one AttemptResult, which is
// handed to the sender in completion order, falling back to the control
// plane and finally recorded as unreported. All methods run on the io
// thread.
class DeliveryPipeline : public IAttemptSink,
                         public std::enable_shared_from_this<DeliveryPipeline> {
public:
  DeliveryPipeline(IoContextManager &io_context_manager,
                   IListenConfigProvider &config_provider,
                   IControlPlaneClient &control_plane, EventBus &event_bus,
                   customio::ConsoleOutput &output);

  void SetSender(IResultSender *sender) { sender_ = sender; }
  void SetRoutes(RouteTablePtr routes) { routes_ = std::move(routes); }
  RouteTablePtr routes() const { return routes_; }

  void OnAttempt(InboundAttempt attempt) override;
  bool Ready() const override;
  void WhenReady(std::function<void()> resume) override;

  // Stops accepting attempts and calls `done(clean)` once every accepted
  // attempt, queued ones included, is finished and reported. At `deadline`
  // the queued and in-flight stragglers are finished as Timeout/"shutdown"
  // and done(false) follows.
  void Drain(std::chrono::milliseconds deadline,
             std::function<void(bool clean)> done) override;
  void Resume() override;

  bool draining() const { return draining_; }
  PipelineStats stats() const;
  const std::vector<std::string> &unreported_ids() const {
    return unreported_ids_;
  }

private:
  struct InFlight {
    InboundAttempt attempt;
    std::string source_name;
    std::string connection_name;
    std::string local_url;
    std::shared_ptr<LocalDispatcher::Call> call;
  };

  void Dispatch(InboundAttempt attempt);
  void OnCallDone(const std::string &attempt_id, AttemptResult result);
  void Finish(InFlight entry, AttemptResult result);
  ReportState Report(const AttemptResult &result);
  void Fallback(const AttemptResult &result);
  void MarkUnreported(const std::string &attempt_id);
  void Pump();
  void NotifyReady();
  void CheckLoad();
  void MaybeFinishDrain();
  void OnDrainDeadline();
  AttemptResult MakeShutdownResult(const InboundAttempt &attempt) const;

  boost::asio::io_context &ioc_;
  const ListenConfig &config_;
  IControlPlaneClient &control_plane_;
  EventBus &event_bus_;
  customio::ConsoleOutput &output_;
  LocalDispatcher dispatcher_;
  IResultSender *sender_{nullptr};
  RouteTablePtr routes_;

  std::unordered_map<std::string, InFlight> in_flight_;
  std::deque<InboundAttempt> pending_;
  std::vector<std::function<void()>> ready_waiters_;
  std::unordered_set<std::string> fallback_in_flight_;

  bool draining_{false};
  bool drain_done_{false};
  bool drain_forced_{false};
  bool load_warned_{false};
  std::function<void(bool)> drain_callback_;
  boost::asio::steady_timer drain_timer_;

  PipelineStats stats_;
  std::vector<std::string> unreported_ids_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
