// src/launch/NotificationChannel.cpp
#include "gstmulti/launch/NotificationChannel.h"

#include <utility>

namespace gstmulti {

const char* notification_kind_name(NotificationKind k) {
  switch (k) {
    case NotificationKind::StateChanged: return "state-changed";
    case NotificationKind::EndOfStream:  return "eos";
    case NotificationKind::Error:        return "error";
    case NotificationKind::Warning:      return "warning";
    case NotificationKind::Latency:      return "latency";
    case NotificationKind::Shutdown:     return "shutdown";
    default:                             return "unknown";
  }
}

void NotificationChannel::push(Notification n) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.push_back(std::move(n));
  }
  cv_.notify_one();
}

std::optional<Notification> NotificationChannel::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  if (!cv_.wait_for(lock, timeout, [&] { return !queue_.empty(); })) {
    return std::nullopt;
  }
  Notification n = std::move(queue_.front());
  queue_.pop_front();
  return n;
}

size_t NotificationChannel::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

} // namespace gstmulti
