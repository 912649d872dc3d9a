#pragma once

#include <chrono>

#include "session/forward_target.hpp"
#include "util/io_monad.hpp"

namespace hookrelay {

// Opens (and closes) a TCP connection to the forwarding target, completing a
// TLS handshake for https targets with verification off. Runs on its own
// io_context and blocks for at most `timeout`.
monad::MyVoidResult CheckServerHealth(const ForwardTarget &target,
                                      std::chrono::milliseconds timeout);

} // namespace hookrelay
