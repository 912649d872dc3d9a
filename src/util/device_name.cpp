#include "util/device_name.hpp"

#include <pwd.h>
#include <unistd.h>

#include <array>
#include <cstdlib>

#include "openssl/openssl_util.hpp"
#include "util/string_util.hpp"

namespace hookrelay {

namespace {

std::string HostName() {
  std::array<char, 256> buf{};
  if (::gethostname(buf.data(), buf.size() - 1) != 0) {
    return "unknown-host";
  }
  std::string host(buf.data());
  // Domain part adds nothing for the dashboard.
  if (auto dot = host.find('.'); dot != std::string::npos && dot > 0) {
    host.erase(dot);
  }
  return host.empty() ? std::string("unknown-host") : host;
}

std::string UserName() {
  if (const char *user = std::getenv("USER"); user && *user) {
    return user;
  }
  if (const auto *pw = ::getpwuid(::geteuid()); pw && pw->pw_name) {
    return pw->pw_name;
  }
  return "user";
}

} // namespace

std::string StableDeviceName(const std::string &host, const std::string &user) {
  const std::string digest = opensslutil::sha256_hex(host + "/" + user);
  return "cli-" + stringutil::slugify(host) + "-" + stringutil::slugify(user) +
         "-" + digest.substr(0, 8);
}

std::string StableDeviceName() { return StableDeviceName(HostName(), UserName()); }

} // namespace hookrelay
