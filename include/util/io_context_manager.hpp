#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <optional>
#include <thread>
#include <vector>

#include "conf/ioc_config.hpp"
#include "customio/output.hpp"

namespace hookrelay {

// Owns the io_context and the threads that run it. Every network component
// of hookrelay posts its work here.
class IoContextManager {
public:
  IoContextManager(IIocConfigProvider &config_provider,
                   customio::IOutput &output);
  ~IoContextManager();

  IoContextManager(const IoContextManager &) = delete;
  IoContextManager &operator=(const IoContextManager &) = delete;

  boost::asio::io_context &ioc() { return ioc_; }

  // Releases the work guard, stops the context and joins the threads.
  // Safe to call more than once; must not be called from an io thread.
  void stop();

  bool stopped() const { return stopped_; }

private:
  boost::asio::io_context ioc_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> threads_;
  customio::IOutput &output_;
  bool stopped_{false};
};

} // namespace hookrelay
