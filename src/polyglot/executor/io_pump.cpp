#include "polyglot/executor/io_pump.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stop_token>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace polyglot::executor::detail {

IoPump::IoPump(std::stop_token stop) : stop_(std::move(stop)) {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC | O_NONBLOCK) == 0) {
    wake_read_.Reset(fds[0]);
    wake_write_.Reset(fds[1]);
    int wake_fd = wake_write_.Get();
    on_stop_.emplace(stop_, std::function<void()>([wake_fd] {
                       char byte = 1;
                       (void)write(wake_fd, &byte, 1);
                     }));
  }
}

// The callback must be gone before the wake pipe closes
IoPump::~IoPump() {
  on_stop_.reset();
}

void IoPump::Watch(UniqueFd& fd, std::string& sink) {
  if (fd.Valid()) {
    readers_.push_back(Reader{.fd = &fd, .sink = &sink});
  }
}

void IoPump::Feed(UniqueFd& fd, std::string data, bool close_when_done) {
  if (!fd.Valid()) {
    return;
  }
  writer_ = Writer{
      .fd = &fd,
      .data = std::move(data),
      .offset = 0,
      .close_when_done = close_when_done,
  };
  if (writer_->data.empty()) {
    if (close_when_done) {
      fd.Reset();
    }
    writer_.reset();
  }
}

auto IoPump::ReadersOpen() const -> bool {
  for (const auto& reader : readers_) {
    if (reader.fd->Valid()) {
      return true;
    }
  }
  return false;
}

auto IoPump::WritePending() const -> bool {
  return writer_.has_value() && writer_->fd->Valid();
}

void IoPump::Clear() {
  readers_.clear();
  writer_.reset();
}

void IoPump::DrainWake() {
  std::array<char, 64> buffer{};
  while (read(wake_read_.Get(), buffer.data(), buffer.size()) > 0) {
  }
}

void IoPump::ServiceReader(Reader& reader) {
  std::array<char, 4096> buffer{};
  while (true) {
    ssize_t n = read(reader.fd->Get(), buffer.data(), buffer.size());
    if (n > 0) {
      reader.sink->append(buffer.data(), static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    // EOF or a hard error; either way the stream is finished
    reader.fd->Reset();
    return;
  }
}

void IoPump::ServiceWriter() {
  auto& w = *writer_;
  while (w.offset < w.data.size()) {
    ssize_t n =
        write(w.fd->Get(), w.data.data() + w.offset, w.data.size() - w.offset);
    if (n > 0) {
      w.offset += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    // EPIPE: the child stopped reading its input
    w.fd->Reset();
    writer_.reset();
    return;
  }
  if (w.close_when_done) {
    w.fd->Reset();
  }
  writer_.reset();
}

auto IoPump::Step(std::chrono::milliseconds wait) -> State {
  if (stop_.stop_requested()) {
    return State::kStopped;
  }

  std::vector<pollfd> fds;
  std::vector<Reader*> polled_readers;
  if (wake_read_.Valid()) {
    fds.push_back(pollfd{.fd = wake_read_.Get(), .events = POLLIN, .revents = 0});
  }
  for (auto& reader : readers_) {
    if (reader.fd->Valid()) {
      fds.push_back(
          pollfd{.fd = reader.fd->Get(), .events = POLLIN, .revents = 0});
      polled_readers.push_back(&reader);
    }
  }
  bool writing = WritePending();
  if (writing) {
    fds.push_back(
        pollfd{.fd = writer_->fd->Get(), .events = POLLOUT, .revents = 0});
  }

  int ready = poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
  if (ready < 0) {
    if (errno == EINTR) {
      return State::kActive;
    }
    error_ = std::strerror(errno);
    return State::kError;
  }

  size_t index = 0;
  if (wake_read_.Valid()) {
    if (fds[index].revents != 0) {
      DrainWake();
    }
    ++index;
  }
  for (auto* reader : polled_readers) {
    if ((fds[index].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      ServiceReader(*reader);
    }
    ++index;
  }
  if (writing && (fds[index].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
    ServiceWriter();
  }

  if (stop_.stop_requested()) {
    return State::kStopped;
  }
  return State::kActive;
}

}  // namespace polyglot::executor::detail
