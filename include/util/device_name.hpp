#pragma once

#include <string>

namespace hookrelay {

// Stable name of the CLI destination for this machine and user, e.g.
// "cli-devbox-alice-3f9a1c2e". The suffix is the first eight hex digits of
// sha256("<host>/<user>") so two users on one host never collide.
std::string StableDeviceName();

// Same as above from explicit parts; exposed for tests.
std::string StableDeviceName(const std::string &host, const std::string &user);

} // namespace hookrelay
