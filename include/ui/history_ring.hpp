#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

#include "ui/event_bus.hpp"

namespace hookrelay {

struct HistoryEntry {
  // Bodies are cut to the ring's body_bytes; the sizes below are the
  // originals.
  DeliveryEvent delivery;
  std::size_t request_body_size{0};
  std::size_t response_body_size{0};
  std::chrono::system_clock::time_point recorded_at;
};

// Latest deliveries, oldest evicted first. Index 0 is the newest entry.
class HistoryRing {
public:
  static constexpr std::size_t kDefaultBodyBytes = 4096;

  explicit HistoryRing(std::size_t capacity = 200,
                       std::size_t body_bytes = kDefaultBodyBytes);

  void Push(DeliveryEvent delivery);
  // False when the attempt already fell out of the ring.
  bool UpdateReport(const std::string &attempt_id, ReportState report);

  const HistoryEntry &at(std::size_t newest_first_index) const;
  std::size_t size() const { return entries_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return entries_.empty(); }
  void Clear() { entries_.clear(); }

private:
  std::size_t capacity_;
  std::size_t body_bytes_;
  std::deque<HistoryEntry> entries_;
};

} // namespace hookrelay
