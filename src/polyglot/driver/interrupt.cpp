#include "interrupt.hpp"

#include <chrono>
#include <csignal>
#include <stop_token>
#include <thread>

#include <spdlog/spdlog.h>

namespace polyglot::driver {

namespace {

volatile std::sig_atomic_t received_signal = 0;

using Handler = void (*)(int);
Handler previous_int = SIG_DFL;
Handler previous_term = SIG_DFL;

extern "C" void OnSignal(int signal) {
  received_signal = signal;
}

}  // namespace

InterruptWatcher::InterruptWatcher() {
  received_signal = 0;
  previous_int = std::signal(SIGINT, OnSignal);
  previous_term = std::signal(SIGTERM, OnSignal);

  poller_ = std::jthread([this](std::stop_token self) {
    while (!self.stop_requested()) {
      if (received_signal != 0) {
        spdlog::warn("received signal {}; cancelling runs", received_signal);
        source_.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });
}

InterruptWatcher::~InterruptWatcher() {
  poller_.request_stop();
  if (poller_.joinable()) {
    poller_.join();
  }
  std::signal(SIGINT, previous_int == SIG_ERR ? SIG_DFL : previous_int);
  std::signal(SIGTERM, previous_term == SIG_ERR ? SIG_DFL : previous_term);
}

auto InterruptWatcher::Signal() const -> int {
  return static_cast<int>(received_signal);
}

}  // namespace polyglot::driver
