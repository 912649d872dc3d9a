#include "tunnel/frame_assembler.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace hookrelay {

FrameAssembler::FrameAssembler(std::size_t max_pending,
                               std::size_t max_body_bytes)
    : max_pending_(max_pending), max_body_bytes_(max_body_bytes) {}

monad::MyResult<std::optional<InboundAttempt>>
FrameAssembler::Add(AttemptFrame frame) {
  using R = monad::MyResult<std::optional<InboundAttempt>>;
  if (!frame.part || frame.part->total <= 1) {
    return R::Ok(std::move(frame.attempt));
  }

  const auto &part = *frame.part;
  if (part.total > kMaxAttemptParts || part.index < 0 ||
      part.index >= part.total) {
    return R::Err(monad::make_error(
        my_errors::JSON::DECODE_ERROR,
        fmt::format("attempt {} part {}/{} out of range",
                    frame.attempt.attempt_id, part.index, part.total)));
  }
  auto it = partial_.find(frame.attempt.attempt_id);
  if (it == partial_.end()) {
    if (partial_.size() >= max_pending_) {
      return R::Err(monad::make_error(
          my_errors::LISTEN::OVERLOADED,
          fmt::format("too many partially received attempts ({})",
                      partial_.size())));
    }
    Partial fresh;
    fresh.total = part.total;
    fresh.pieces.resize(static_cast<std::size_t>(part.total));
    it = partial_.emplace(frame.attempt.attempt_id, std::move(fresh)).first;
  }

  auto &p = it->second;
  const std::string attempt_id = it->first;
  if (p.total != part.total) {
    partial_.erase(it);
    return R::Err(monad::make_error(
        my_errors::JSON::DECODE_ERROR,
        fmt::format("attempt {} part count changed from {} to {}", attempt_id,
                    p.total, part.total)));
  }
  auto &slot = p.pieces[static_cast<std::size_t>(part.index)];
  if (slot) {
    partial_.erase(it);
    return R::Err(monad::make_error(
        my_errors::JSON::DECODE_ERROR,
        fmt::format("attempt {} part {} received twice", attempt_id,
                    part.index)));
  }
  p.bytes += frame.attempt.body.size();
  if (p.bytes > max_body_bytes_) {
    partial_.erase(it);
    return R::Err(monad::make_error(
        my_errors::LISTEN::OVERLOADED,
        fmt::format("attempt {} body exceeds {} bytes", attempt_id,
                    max_body_bytes_)));
  }
  slot = std::move(frame.attempt.body);
  if (part.index == 0) {
    p.head = std::move(frame.attempt);
  }
  ++p.received;
  if (p.received < p.total) {
    return R::Ok(std::nullopt);
  }

  InboundAttempt done = std::move(p.head);
  done.body.clear();
  done.body.reserve(p.bytes);
  for (auto &piece : p.pieces) {
    done.body += *piece;
  }
  partial_.erase(it);
  return R::Ok(std::move(done));
}

} // namespace hookrelay
