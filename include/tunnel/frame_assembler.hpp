#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tunnel/tunnel_messages.hpp"
#include "util/io_monad.hpp"

namespace hookrelay {

// Reassembles ATTEMPT frames the dispatcher split into parts. Parts may
// arrive in any order; the attempt is released once every index is present.
// Unsplit frames pass straight through.
class FrameAssembler {
public:
  explicit FrameAssembler(std::size_t max_pending = 64,
                          std::size_t max_body_bytes = 16 * 1024 * 1024);

  // Ok(nullopt) while parts are still missing.
  monad::MyResult<std::optional<InboundAttempt>> Add(AttemptFrame frame);

  std::size_t pending() const { return partial_.size(); }
  void Clear() { partial_.clear(); }

private:
  struct Partial {
    InboundAttempt head;
    int total{0};
    int received{0};
    std::size_t bytes{0};
    std::vector<std::optional<std::string>> pieces;
  };

  std::size_t max_pending_;
  std::size_t max_body_bytes_;
  std::unordered_map<std::string, Partial> partial_;
};

} // namespace hookrelay
