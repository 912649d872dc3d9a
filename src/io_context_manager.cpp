#include "util/io_context_manager.hpp"

#include <algorithm>

#include "util/my_logging.hpp"

namespace hookrelay {

IoContextManager::IoContextManager(IIocConfigProvider &config_provider,
                                   customio::IOutput &output)
    : output_(output) {
  const auto &cfg = config_provider.get();
  const int threads = std::max(1, cfg.threads_num);
  work_guard_.emplace(boost::asio::make_work_guard(ioc_));
  threads_.reserve(static_cast<std::size_t>(threads));
  for (int i = 0; i < threads; ++i) {
    threads_.emplace_back([this]() {
      src::severity_logger<trivial::severity_level> lg;
      for (;;) {
        try {
          ioc_.run();
          break;
        } catch (const std::exception &ex) {
          BOOST_LOG_SEV(lg, trivial::error)
              << "io_context handler threw: " << ex.what();
          output_.error() << "Unhandled error in event loop: " << ex.what()
                          << std::endl;
        }
      }
    });
  }
  output_.debug() << "io_context '" << cfg.name << "' running with " << threads
                  << " thread(s)" << std::endl;
}

IoContextManager::~IoContextManager() { stop(); }

void IoContextManager::stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;
  work_guard_.reset();
  ioc_.stop();
  for (auto &t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();
}

} // namespace hookrelay
