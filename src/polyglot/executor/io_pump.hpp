#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "polyglot/executor/process.hpp"

namespace polyglot::executor::detail {

// poll() loop over a child's pipes plus a wake-up pipe that the stop token
// writes to, so cancellation interrupts a blocked wait immediately.
class IoPump {
 public:
  enum class State : uint8_t {
    kActive,
    kStopped,  // Stop was requested
    kError,    // poll() failed
  };

  explicit IoPump(std::stop_token stop);
  ~IoPump();

  IoPump(const IoPump&) = delete;
  auto operator=(const IoPump&) -> IoPump& = delete;
  IoPump(IoPump&&) = delete;
  auto operator=(IoPump&&) -> IoPump& = delete;

  // Append everything read from `fd` to `sink`; `fd` is reset on EOF.
  void Watch(UniqueFd& fd, std::string& sink);

  // Write `data` to `fd`; resets `fd` once written if `close_when_done`.
  void Feed(UniqueFd& fd, std::string data, bool close_when_done);

  // Waits up to `wait` for activity and services ready descriptors.
  auto Step(std::chrono::milliseconds wait) -> State;

  [[nodiscard]] auto ReadersOpen() const -> bool;
  [[nodiscard]] auto WritePending() const -> bool;

  // Forget watched descriptors without closing them.
  void Clear();

  [[nodiscard]] auto ErrorText() const -> const std::string& {
    return error_;
  }

 private:
  struct Reader {
    UniqueFd* fd;
    std::string* sink;
  };

  struct Writer {
    UniqueFd* fd;
    std::string data;
    size_t offset = 0;
    bool close_when_done = false;
  };

  void DrainWake();
  void ServiceReader(Reader& reader);
  void ServiceWriter();

  std::stop_token stop_;
  UniqueFd wake_read_;
  UniqueFd wake_write_;
  std::optional<std::stop_callback<std::function<void()>>> on_stop_;
  std::vector<Reader> readers_;
  std::optional<Writer> writer_;
  std::string error_;
};

}  // namespace polyglot::executor::detail
