#include "ui/history_ring.hpp"

#include <algorithm>
#include <stdexcept>

namespace hookrelay {

HistoryRing::HistoryRing(std::size_t capacity, std::size_t body_bytes)
    : capacity_(std::max<std::size_t>(1, capacity)), body_bytes_(body_bytes) {}

void HistoryRing::Push(DeliveryEvent delivery) {
  if (entries_.size() == capacity_) {
    entries_.pop_front();
  }
  HistoryEntry entry;
  entry.request_body_size = delivery.attempt.body.size();
  entry.response_body_size = delivery.result.body.size();
  if (delivery.attempt.body.size() > body_bytes_) {
    delivery.attempt.body.resize(body_bytes_);
    delivery.attempt.body.shrink_to_fit();
  }
  if (delivery.result.body.size() > body_bytes_) {
    delivery.result.body.resize(body_bytes_);
    delivery.result.body.shrink_to_fit();
  }
  entry.delivery = std::move(delivery);
  entry.recorded_at = std::chrono::system_clock::now();
  entries_.push_back(std::move(entry));
}

bool HistoryRing::UpdateReport(const std::string &attempt_id,
                               ReportState report) {
  // Recent entries are the likely match.
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if (it->delivery.attempt.attempt_id == attempt_id) {
      it->delivery.report = report;
      return true;
    }
  }
  return false;
}

const HistoryEntry &HistoryRing::at(std::size_t newest_first_index) const {
  if (newest_first_index >= entries_.size()) {
    throw std::out_of_range("history index out of range");
  }
  return entries_[entries_.size() - 1 - newest_first_index];
}

} // namespace hookrelay
