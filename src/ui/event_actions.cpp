#include "ui/event_actions.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace hookrelay {

namespace {

std::string TrimTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace

std::string EventWebUrl(const ListenConfig &config,
                        const std::string &project_mode,
                        const std::string &event_id) {
  if (project_mode == "console") {
    return fmt::format("{}/?event_id={}",
                       TrimTrailingSlash(config.console_base_url), event_id);
  }
  return fmt::format("{}/events/{}",
                     TrimTrailingSlash(config.dashboard_base_url), event_id);
}

EventActions::EventActions(IControlPlaneClient &control_plane,
                           IListenConfigProvider &config_provider,
                           const Credential &credential, EventBus &event_bus)
    : control_plane_(control_plane), config_(config_provider.get()),
      project_mode_(credential.project_mode), event_bus_(event_bus),
      launcher_(&EventActions::LaunchDetached) {}

void EventActions::Retry(const std::string &event_id) {
  if (event_id.empty()) {
    event_bus_.Publish(NoticeEvent{NoticeEvent::Level::Warning,
                                   "This delivery has no event to retry"});
    return;
  }
  BOOST_LOG_SEV(lg, trivial::info) << "retrying event " << event_id;
  event_bus_.Publish(NoticeEvent{NoticeEvent::Level::Info,
                                 fmt::format("Retrying event {}…", event_id)});
  auto *bus = &event_bus_;
  control_plane_.RetryEvent(event_id).run(
      [bus, event_id](monad::MyVoidResult r) {
        if (r.is_ok()) {
          bus->Publish(NoticeEvent{
              NoticeEvent::Level::Info,
              fmt::format("Event {} queued for retry", event_id)});
        } else {
          bus->Publish(NoticeEvent{
              NoticeEvent::Level::Error,
              fmt::format("Retry of {} failed: {}", event_id, r.error().what)});
        }
      });
}

monad::MyVoidResult EventActions::Open(const std::string &event_id) {
  if (event_id.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "delivery has no event id"));
  }
  const std::string url = EventWebUrl(config_, project_mode_, event_id);
#ifdef __APPLE__
  const std::vector<std::string> argv{"open", url};
#else
  const std::vector<std::string> argv{"xdg-open", url};
#endif
  auto r = launcher_(argv);
  if (r.is_err()) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "could not open " << url << ": " << r.error();
    event_bus_.Publish(NoticeEvent{NoticeEvent::Level::Warning,
                                   fmt::format("Open {} manually", url)});
    return r;
  }
  event_bus_.Publish(
      NoticeEvent{NoticeEvent::Level::Info, fmt::format("Opened {}", url)});
  return r;
}

monad::MyVoidResult
EventActions::LaunchDetached(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "empty command"));
  }
  const pid_t pid = ::fork();
  if (pid < 0) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::UNEXPECTED_RESULT,
        fmt::format("fork failed: {}", std::strerror(errno))));
  }
  if (pid == 0) {
    // Second fork so the opener is reparented and never left as a zombie.
    if (::fork() != 0) {
      ::_exit(0);
    }
    ::setsid();
    // The dashboard owns the terminal; keep the opener's chatter off it.
    if (int devnull = ::open("/dev/null", O_RDWR); devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
      ::dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) {
        ::close(devnull);
      }
    }
    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &a : argv) {
      args.push_back(const_cast<char *>(a.c_str()));
    }
    args.push_back(nullptr);
    ::execvp(args[0], args.data());
    ::_exit(127);
  }
  int status = 0;
  ::waitpid(pid, &status, 0);
  return monad::MyVoidResult::Ok();
}

} // namespace hookrelay
