#pragma once

#include <stop_token>
#include <thread>

namespace polyglot::driver {

// Turns SIGINT / SIGTERM into a stop request for as long as it is alive.
// The previous handlers are restored on destruction.
class InterruptWatcher {
 public:
  InterruptWatcher();
  ~InterruptWatcher();

  InterruptWatcher(const InterruptWatcher&) = delete;
  auto operator=(const InterruptWatcher&) -> InterruptWatcher& = delete;
  InterruptWatcher(InterruptWatcher&&) = delete;
  auto operator=(InterruptWatcher&&) -> InterruptWatcher& = delete;

  [[nodiscard]] auto Token() const -> std::stop_token {
    return source_.get_token();
  }

  // Signal number that triggered the stop, 0 if none did.
  [[nodiscard]] auto Signal() const -> int;

 private:
  std::stop_source source_;
  std::jthread poller_;
};

}  // namespace polyglot::driver
