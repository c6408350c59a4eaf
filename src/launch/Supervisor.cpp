// src/launch/Supervisor.cpp
#include "gstmulti/launch/Supervisor.h"

#include "gstmulti/gst/GstBusWatch.h"
#include "gstmulti/gst/GstHelpers.h"
#include "gstmulti/launch/Errors.h"
#include "gstmulti/launch/LatencyCoordinator.h"

#include <gst/gst.h>

#include <chrono>
#include <iostream>
#include <utility>

namespace gstmulti {
namespace {

constexpr auto kMonitorSlice = std::chrono::milliseconds(200);
constexpr GstClockTime kBusPollSlice = 100 * GST_MSECOND;

void log_latency(const std::string& pipeline, GstElement* e, const char* when) {
  LatencyRange r;
  if (!query_latency(e, r)) {
    std::cerr << "[supervisor] " << pipeline << ": latency " << when << " recalculation: unavailable\n";
    return;
  }
  std::cerr << "[supervisor] " << pipeline << ": latency " << when << " recalculation:"
            << " live=" << (r.live ? "true" : "false")
            << " min-ns=" << clock_time_to_string(r.min)
            << " max-ns=" << clock_time_to_string(r.max) << "\n";
}

} // namespace

const char* termination_cause_name(TerminationCause c) {
  switch (c) {
    case TerminationCause::EndOfStream: return "end-of-stream";
    case TerminationCause::EngineError: return "engine-error";
    case TerminationCause::Exit:        return "exit";
    case TerminationCause::Interrupted: return "interrupted";
    default:                            return "unknown";
  }
}

Supervisor::Supervisor(PipelineRegistry& registry, const LaunchOptions& opt)
  : registry_(registry), opt_(opt) {}

Supervisor::~Supervisor() {
  stop_watchers();
}

void Supervisor::launch(const std::vector<PipelineSpec>& specs) {
  for (const auto& spec : specs) {
    try {
      PipelineHandle& h = registry_.register_pipeline(spec);
      try {
        start_one(h);
      } catch (const LaunchError&) {
        registry_.discard_last(spec.name);
        throw;
      }
    } catch (const LaunchError& e) {
      std::cerr << "[supervisor] startup failed: " << e.what()
                << "; stopping pipelines already started\n";
      stop_all();
      throw;
    }
  }
}

void Supervisor::start_all() {
  for (PipelineHandle* h : registry_.all()) {
    if (h->state() != PipelineState::Constructed) continue;
    try {
      start_one(*h);
    } catch (const LaunchError& e) {
      std::cerr << "[supervisor] startup failed: " << e.what()
                << "; stopping pipelines already started\n";
      stop_all();
      throw;
    }
  }
}

void Supervisor::start_one(PipelineHandle& h) {
  try {
    h.start(opt_.state_timeout_ms);
  } catch (const LaunchError&) {
    maybe_dump_dot(h.pipeline(), opt_.dot_dir, h.name() + "_start_failed");
    throw;
  }
  start_watcher(h);
  if (opt_.verbose) {
    std::cerr << "[supervisor] " << h.name() << ": started\n";
  }
}

void Supervisor::start_watcher(PipelineHandle& h) {
  std::lock_guard<std::mutex> lock(watchers_mu_);
  watchers_.emplace_back(&Supervisor::watch_bus, this, &h);
}

void Supervisor::stop_watchers() {
  std::lock_guard<std::mutex> lock(watchers_mu_);
  watchers_stop_.store(true);
  for (auto& t : watchers_) {
    if (t.joinable()) t.join();
  }
  watchers_.clear();
}

void Supervisor::watch_bus(PipelineHandle* h) {
  GstBus* bus = gst_element_get_bus(h->pipeline());
  if (!bus) {
    channel_.push({NotificationKind::Error, h->name(), h->name(), "pipeline has no bus"});
    return;
  }

  const auto types = static_cast<GstMessageType>(
      GST_MESSAGE_EOS | GST_MESSAGE_ERROR | GST_MESSAGE_WARNING |
      GST_MESSAGE_STATE_CHANGED | GST_MESSAGE_LATENCY);

  while (!watchers_stop_.load()) {
    GstMessage* msg = gst_bus_timed_pop_filtered(bus, kBusPollSlice, types);
    if (!msg) continue;

    Notification n;
    n.pipeline = h->name();
    n.source = gst_message_source_name(msg);
    n.message = gst_message_to_string(msg);

    bool forward = true;
    switch (GST_MESSAGE_TYPE(msg)) {
      case GST_MESSAGE_EOS:     n.kind = NotificationKind::EndOfStream; break;
      case GST_MESSAGE_ERROR:   n.kind = NotificationKind::Error; break;
      case GST_MESSAGE_WARNING: n.kind = NotificationKind::Warning; break;
      case GST_MESSAGE_LATENCY: n.kind = NotificationKind::Latency; break;
      case GST_MESSAGE_STATE_CHANGED:
        // Only the pipeline's own transitions, not every child's.
        n.kind = NotificationKind::StateChanged;
        forward = GST_MESSAGE_SRC(msg) == GST_OBJECT(h->pipeline());
        break;
      default:
        forward = false;
        break;
    }
    gst_message_unref(msg);
    if (forward) channel_.push(std::move(n));
  }
  gst_object_unref(bus);
}

Termination Supervisor::monitor(const std::atomic<bool>* interrupted) {
  while (true) {
    if (interrupted && interrupted->load()) {
      return {TerminationCause::Interrupted, "", "interrupted by signal"};
    }
    auto n = channel_.pop(kMonitorSlice);
    if (!n) continue;

    switch (n->kind) {
      case NotificationKind::StateChanged:
        if (opt_.verbose) std::cerr << "[supervisor] " << n->pipeline << ": " << n->message << "\n";
        break;
      case NotificationKind::Warning:
        std::cerr << "[WARN] pipeline " << n->pipeline << ": " << n->source << ": " << n->message << "\n";
        break;
      case NotificationKind::Latency:
        recalculate_latency(n->pipeline);
        break;
      case NotificationKind::EndOfStream:
        // Any pipeline finishing ends the whole session.
        std::cerr << "[supervisor] " << n->pipeline << ": end of stream, shutting down session\n";
        stop_all();
        return {TerminationCause::EndOfStream, n->pipeline, n->message};
      case NotificationKind::Error: {
        std::cerr << "[supervisor] " << n->pipeline << ": error from " << n->source << ": "
                  << n->message << "\n";
        try {
          maybe_dump_dot(registry_.lookup_pipeline(n->pipeline).pipeline(), opt_.dot_dir,
                         n->pipeline + "_error");
        } catch (const LaunchError&) {
          // already stopped, nothing to dump
        }
        stop_all();
        return {TerminationCause::EngineError, n->pipeline, n->message};
      }
      case NotificationKind::Shutdown:
        return {TerminationCause::Exit, "", n->message};
    }
  }
}

void Supervisor::recalculate_latency(const std::string& pipeline_name) {
  GstElement* p = nullptr;
  try {
    p = registry_.lookup_pipeline(pipeline_name).pipeline();
  } catch (const LaunchError&) {
    return;
  }
  if (opt_.verbose) log_latency(pipeline_name, p, "before");
  if (!gst_bin_recalculate_latency(GST_BIN(p))) {
    std::cerr << "[WARN] pipeline " << pipeline_name << ": latency recalculation failed\n";
    return;
  }
  if (opt_.verbose) log_latency(pipeline_name, p, "after");
}

void Supervisor::stop_all() {
  {
    std::lock_guard<std::mutex> lock(stop_mu_);
    if (stopped_all_) return;
    stopped_all_ = true;
    ++stop_all_runs_;
  }

  const auto handles = registry_.all();
  for (PipelineHandle* h : handles) h->mark_stopping();

  std::vector<std::string> failures;
  for (auto it = handles.rbegin(); it != handles.rend(); ++it) {
    std::string err;
    if (!(*it)->stop(err)) {
      std::cerr << "[WARN] pipeline " << (*it)->name() << ": stop failed: " << err << "\n";
      failures.push_back((*it)->name() + ": " + err);
    } else if (opt_.verbose) {
      std::cerr << "[supervisor] " << (*it)->name() << ": stopped\n";
    }
  }
  stop_watchers();

  std::lock_guard<std::mutex> lock(stop_mu_);
  stop_failures_ = std::move(failures);
}

void Supervisor::request_shutdown(const std::string& reason) {
  channel_.push({NotificationKind::Shutdown, "", "", reason});
}

int Supervisor::stop_all_runs() const {
  std::lock_guard<std::mutex> lock(stop_mu_);
  return stop_all_runs_;
}

std::vector<std::string> Supervisor::stop_failures() const {
  std::lock_guard<std::mutex> lock(stop_mu_);
  return stop_failures_;
}

} // namespace gstmulti
