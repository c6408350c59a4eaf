#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace gstmulti {

enum class NotificationKind {
  StateChanged,
  EndOfStream,
  Error,
  Warning,
  Latency,
  Shutdown,  // posted by the session itself (exit command, end of input, signal)
};

const char* notification_kind_name(NotificationKind k);

struct Notification {
  NotificationKind kind = NotificationKind::StateChanged;
  std::string pipeline;  // empty for Shutdown
  std::string source;    // element that posted the bus message
  std::string message;
};

// Multi-producer, single-consumer queue. Each pipeline's bus watcher pushes
// into the same channel; the supervisor pops in arrival order (per-pipeline
// order is preserved since one watcher serves one bus).
class NotificationChannel {
public:
  void push(Notification n);

  // Waits at most `timeout` for the next notification.
  std::optional<Notification> pop(std::chrono::milliseconds timeout);

  size_t pending() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Notification> queue_;
};

} // namespace gstmulti
