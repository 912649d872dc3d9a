#include "pipeline/delivery_pipeline.hpp"

#include <boost/asio/post.hpp>
#include <fmt/format.h>

#include <algorithm>

namespace hookrelay {

namespace {

std::int64_t NowEpochMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string DescribeResult(const AttemptResult &result) {
  if (result.ok()) {
    return fmt::format("{} in {} ms", result.status.value_or(0),
                       result.elapsed.count());
  }
  return fmt::format("{}: {}", to_string(result.error_class), result.reason);
}

} // namespace

DeliveryPipeline::DeliveryPipeline(IoContextManager &io_context_manager,
                                   IListenConfigProvider &config_provider,
                                   IControlPlaneClient &control_plane,
                                   EventBus &event_bus,
                                   customio::ConsoleOutput &output)
    : ioc_(io_context_manager.ioc()), config_(config_provider.get()),
      control_plane_(control_plane), event_bus_(event_bus), output_(output),
      dispatcher_(io_context_manager.ioc()),
      routes_(std::make_shared<const RouteTable>()),
      drain_timer_(io_context_manager.ioc()) {}

PipelineStats DeliveryPipeline::stats() const {
  PipelineStats s = stats_;
  s.in_flight = in_flight_.size();
  s.pending = pending_.size();
  return s;
}

bool DeliveryPipeline::Ready() const {
  return pending_.size() <
         static_cast<std::size_t>(config_.pending_queue_capacity);
}

void DeliveryPipeline::WhenReady(std::function<void()> resume) {
  if (Ready()) {
    boost::asio::post(ioc_, std::move(resume));
    return;
  }
  ready_waiters_.push_back(std::move(resume));
}

void DeliveryPipeline::OnAttempt(InboundAttempt attempt) {
  if (in_flight_.count(attempt.attempt_id) > 0 ||
      std::any_of(pending_.begin(), pending_.end(), [&](const auto &p) {
        return p.attempt_id == attempt.attempt_id;
      })) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "duplicate attempt ignored: " << attempt.attempt_id;
    return;
  }

  if (draining_) {
    BOOST_LOG_SEV(lg, trivial::info)
        << "attempt " << attempt.attempt_id << " arrived while draining";
    InFlight entry;
    entry.attempt = std::move(attempt);
    auto result = MakeShutdownResult(entry.attempt);
    Finish(std::move(entry), std::move(result));
    MaybeFinishDrain();
    return;
  }

  if (in_flight_.size() <
      static_cast<std::size_t>(std::max(1, config_.max_concurrent_attempts))) {
    Dispatch(std::move(attempt));
  } else {
    // The transport stops reading once Ready() is false, so at most one
    // frame lands beyond the capacity.
    pending_.push_back(std::move(attempt));
  }
  CheckLoad();
}

void DeliveryPipeline::Dispatch(InboundAttempt attempt) {
  InFlight entry;
  const Route *route = routes_ ? routes_->Find(attempt.connection_id) : nullptr;
  if (!route) {
    ++stats_.unknown_route;
    BOOST_LOG_SEV(lg, trivial::warning)
        << "no route for connection " << attempt.connection_id
        << ", attempt " << attempt.attempt_id;
    AttemptResult result;
    result.attempt_id = attempt.attempt_id;
    result.path = attempt.path;
    result.error_class = ErrorClass::LocalNonHttp;
    result.reason =
        fmt::format("unknown route for connection {}", attempt.connection_id);
    result.elapsed = std::chrono::milliseconds(1);
    result.finished_at_ms = NowEpochMillis();
    entry.attempt = std::move(attempt);
    Finish(std::move(entry), std::move(result));
    return;
  }

  LocalRequest request;
  request.attempt_id = attempt.attempt_id;
  request.path = attempt.path;
  request.target = route->target;
  request.method = attempt.method;
  request.request_target =
      RouteTable::LocalRequestTarget(*route, attempt.path, attempt.query);
  request.headers = attempt.headers;
  request.body = attempt.body;
  request.source_name = route->source_name;
  request.timeout = std::chrono::milliseconds(
      attempt.timeout_ms.value_or(config_.request_timeout_ms));
  request.max_body_bytes = static_cast<std::size_t>(config_.max_body_bytes);

  entry.source_name = route->source_name;
  entry.connection_name = route->connection_name;
  entry.local_url = fmt::format("{}://{}{}", route->target.scheme,
                                route->target.host_header,
                                request.request_target);
  entry.attempt = std::move(attempt);

  const std::string id = entry.attempt.attempt_id;
  output_.logger().debug() << entry.attempt.method << ' ' << entry.local_url
                           << " (" << id << ')' << std::endl;
  in_flight_.emplace(id, std::move(entry));

  std::weak_ptr<DeliveryPipeline> weak = weak_from_this();
  auto call = dispatcher_.Dispatch(
      std::move(request), [weak, id](AttemptResult result) {
        if (auto self = weak.lock()) {
          self->OnCallDone(id, std::move(result));
        }
      });
  if (auto it = in_flight_.find(id); it != in_flight_.end()) {
    it->second.call = std::move(call);
  }
}

void DeliveryPipeline::OnCallDone(const std::string &attempt_id,
                                  AttemptResult result) {
  auto it = in_flight_.find(attempt_id);
  if (it == in_flight_.end()) {
    return;
  }
  InFlight entry = std::move(it->second);
  in_flight_.erase(it);
  Finish(std::move(entry), std::move(result));
  Pump();
  MaybeFinishDrain();
}

void DeliveryPipeline::Finish(InFlight entry, AttemptResult result) {
  ++stats_.completed;
  if (result.attempt_id.empty()) {
    result.attempt_id = entry.attempt.attempt_id;
  }
  BOOST_LOG_SEV(lg, trivial::info)
      << "attempt " << result.attempt_id << " finished: "
      << DescribeResult(result);

  const ReportState report = Report(result);

  DeliveryEvent event;
  event.attempt = std::move(entry.attempt);
  event.result = result;
  event.source_name = std::move(entry.source_name);
  event.connection_name = std::move(entry.connection_name);
  event.local_url = std::move(entry.local_url);
  event.report = report;
  event_bus_.Publish(event);

  if (report == ReportState::Pending) {
    Fallback(result);
  }
}

ReportState DeliveryPipeline::Report(const AttemptResult &result) {
  if (sender_) {
    auto sent = sender_->SendResult(result);
    if (sent.is_ok()) {
      ++stats_.sent;
      return ReportState::Sent;
    }
    BOOST_LOG_SEV(lg, trivial::warning)
        << "socket cannot carry result " << result.attempt_id << ": "
        << sent.error();
  }
  if (drain_forced_) {
    MarkUnreported(result.attempt_id);
    return ReportState::Unreported;
  }
  return ReportState::Pending;
}

void DeliveryPipeline::Fallback(const AttemptResult &result) {
  const std::string id = result.attempt_id;
  fallback_in_flight_.insert(id);
  std::weak_ptr<DeliveryPipeline> weak = weak_from_this();
  control_plane_.SubmitAttemptResult(result).run(
      [weak, id](monad::MyVoidResult r) {
        auto self = weak.lock();
        if (!self) {
          return;
        }
        // Already written off by the drain deadline.
        if (self->fallback_in_flight_.erase(id) == 0) {
          return;
        }
        if (r.is_ok()) {
          ++self->stats_.fallback;
          BOOST_LOG_SEV(self->lg, trivial::info)
              << "result " << id << " reported over HTTP";
          self->event_bus_.Publish(
              ReportUpdateEvent{id, ReportState::Fallback});
        } else {
          BOOST_LOG_SEV(self->lg, trivial::error)
              << "result " << id << " could not be reported: " << r.error();
          self->MarkUnreported(id);
          self->event_bus_.Publish(
              ReportUpdateEvent{id, ReportState::Unreported});
        }
        self->MaybeFinishDrain();
      });
}

void DeliveryPipeline::MarkUnreported(const std::string &attempt_id) {
  ++stats_.unreported;
  unreported_ids_.push_back(attempt_id);
}

void DeliveryPipeline::Pump() {
  const auto cap =
      static_cast<std::size_t>(std::max(1, config_.max_concurrent_attempts));
  // Queued attempts keep their turn during a drain until the deadline.
  while (!drain_forced_ && in_flight_.size() < cap && !pending_.empty()) {
    auto next = std::move(pending_.front());
    pending_.pop_front();
    Dispatch(std::move(next));
  }
  CheckLoad();
  NotifyReady();
}

void DeliveryPipeline::NotifyReady() {
  if (!Ready() || ready_waiters_.empty()) {
    return;
  }
  auto waiters = std::move(ready_waiters_);
  ready_waiters_.clear();
  for (auto &w : waiters) {
    boost::asio::post(ioc_, std::move(w));
  }
}

void DeliveryPipeline::CheckLoad() {
  const std::size_t capacity =
      static_cast<std::size_t>(std::max(1, config_.max_concurrent_attempts)) +
      static_cast<std::size_t>(std::max(0, config_.pending_queue_capacity));
  const std::size_t load = in_flight_.size() + pending_.size();
  if (!load_warned_ && load * 5 >= capacity * 4) {
    load_warned_ = true;
    auto text = fmt::format(
        "Local server is falling behind: {} of {} delivery slots in use",
        load, capacity);
    output_.logger().warning() << text << std::endl;
    BOOST_LOG_SEV(lg, trivial::warning) << text;
    event_bus_.Publish(NoticeEvent{NoticeEvent::Level::Warning, text});
  } else if (load_warned_ && load * 2 < capacity) {
    load_warned_ = false;
  }
}

void DeliveryPipeline::Drain(std::chrono::milliseconds deadline,
                             std::function<void(bool clean)> done) {
  if (draining_) {
    // Only the first caller is told; later calls just wait for the same end.
    if (!drain_callback_ && !drain_done_) {
      drain_callback_ = std::move(done);
    }
    return;
  }
  draining_ = true;
  drain_callback_ = std::move(done);
  BOOST_LOG_SEV(lg, trivial::info)
      << "draining: " << in_flight_.size() << " in flight, "
      << pending_.size() << " queued, deadline " << deadline.count() << " ms";

  std::weak_ptr<DeliveryPipeline> weak = weak_from_this();
  drain_timer_.expires_after(deadline);
  drain_timer_.async_wait([weak](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (auto self = weak.lock()) {
      self->OnDrainDeadline();
    }
  });

  MaybeFinishDrain();
}

void DeliveryPipeline::Resume() {
  if (!draining_ || !drain_done_) {
    return;
  }
  draining_ = false;
  drain_done_ = false;
  drain_forced_ = false;
  BOOST_LOG_SEV(lg, trivial::info) << "accepting attempts again";
  NotifyReady();
}

void DeliveryPipeline::OnDrainDeadline() {
  if (drain_done_) {
    return;
  }
  drain_forced_ = true;
  BOOST_LOG_SEV(lg, trivial::warning)
      << "drain deadline reached with " << in_flight_.size()
      << " attempts in flight, " << pending_.size() << " queued and "
      << fallback_in_flight_.size() << " unreported results";

  // Queued attempts go first so cancelled calls cannot pump them.
  while (!pending_.empty()) {
    InFlight entry;
    entry.attempt = std::move(pending_.front());
    pending_.pop_front();
    auto result = MakeShutdownResult(entry.attempt);
    Finish(std::move(entry), std::move(result));
  }

  // Cancel completes synchronously and erases from in_flight_.
  std::vector<std::shared_ptr<LocalDispatcher::Call>> calls;
  calls.reserve(in_flight_.size());
  for (auto &[id, entry] : in_flight_) {
    if (entry.call) {
      calls.push_back(entry.call);
    }
  }
  for (auto &call : calls) {
    call->Cancel("shutdown");
  }

  auto outstanding = std::move(fallback_in_flight_);
  fallback_in_flight_.clear();
  for (const auto &id : outstanding) {
    MarkUnreported(id);
    event_bus_.Publish(ReportUpdateEvent{id, ReportState::Unreported});
  }

  // Entries without a live call (should not happen) are finished here.
  while (!in_flight_.empty()) {
    auto it = in_flight_.begin();
    InFlight entry = std::move(it->second);
    in_flight_.erase(it);
    auto result = MakeShutdownResult(entry.attempt);
    Finish(std::move(entry), std::move(result));
  }
  MaybeFinishDrain();
}

void DeliveryPipeline::MaybeFinishDrain() {
  if (!draining_ || drain_done_ || !in_flight_.empty() || !pending_.empty() ||
      !fallback_in_flight_.empty()) {
    return;
  }
  drain_done_ = true;
  drain_timer_.cancel();
  const bool clean = !drain_forced_ && unreported_ids_.empty();
  BOOST_LOG_SEV(lg, trivial::info)
      << "drain finished " << (clean ? "cleanly" : "with losses");
  if (auto done = std::move(drain_callback_)) {
    drain_callback_ = nullptr;
    boost::asio::post(ioc_, [done = std::move(done), clean] { done(clean); });
  }
}

AttemptResult
DeliveryPipeline::MakeShutdownResult(const InboundAttempt &attempt) const {
  AttemptResult result;
  result.attempt_id = attempt.attempt_id;
  result.path = attempt.path;
  result.error_class = ErrorClass::Timeout;
  result.reason = "shutdown";
  result.elapsed = std::chrono::milliseconds(1);
  result.finished_at_ms = NowEpochMillis();
  return result;
}

} // namespace hookrelay
