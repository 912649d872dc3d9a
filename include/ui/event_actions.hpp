#pragma once

#include <functional>
#include <string>
#include <vector>

#include "conf/credential_store.hpp"
#include "conf/listen_config.hpp"
#include "control_plane/control_plane_client.hpp"
#include "ui/event_bus.hpp"
#include "util/io_monad.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

// Link to an event in the web UI: console projects use
// "<console>/?event_id=<id>", others "<dashboard>/events/<id>".
std::string EventWebUrl(const ListenConfig &config,
                        const std::string &project_mode,
                        const std::string &event_id);

// The r/o key bindings. Outcomes are published as NoticeEvents.
class EventActions {
public:
  // argv for the URL opener; replaced in tests.
  using Launcher =
      std::function<monad::MyVoidResult(const std::vector<std::string> &argv)>;

  EventActions(IControlPlaneClient &control_plane,
               IListenConfigProvider &config_provider,
               const Credential &credential, EventBus &event_bus);

  void Retry(const std::string &event_id);
  monad::MyVoidResult Open(const std::string &event_id);

  void set_launcher(Launcher launcher) { launcher_ = std::move(launcher); }

  // fork/exec of xdg-open (open on macOS), detached.
  static monad::MyVoidResult LaunchDetached(const std::vector<std::string> &argv);

private:
  IControlPlaneClient &control_plane_;
  const ListenConfig &config_;
  std::string project_mode_;
  EventBus &event_bus_;
  Launcher launcher_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
