// src/launch/PipelineHandle.cpp
#include "gstmulti/launch/PipelineHandle.h"

#include "gstmulti/gst/GstBusWatch.h"
#include "gstmulti/gst/GstHelpers.h"
#include "gstmulti/launch/Errors.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace gstmulti {
namespace {

// Consumer halves of the inter-pipeline element pairs.
bool is_inter_consumer(const std::string& factory) {
  return factory == "intersrc" || factory == "intervideosrc" ||
         factory == "interaudiosrc" || factory == "intersubsrc";
}

struct EosGuardCtx {
  std::string pipeline_name;
  std::shared_ptr<std::atomic<bool>> stopping;
};

GstPadProbeReturn on_consumer_event(GstPad* pad, GstPadProbeInfo* info, gpointer user_data) {
  auto* ctx = static_cast<EosGuardCtx*>(user_data);
  GstEvent* event = GST_PAD_PROBE_INFO_EVENT(info);
  if (!event || GST_EVENT_TYPE(event) != GST_EVENT_EOS) return GST_PAD_PROBE_OK;
  if (ctx->stopping->load()) return GST_PAD_PROBE_OK;

  GstElement* element = gst_pad_get_parent_element(pad);
  if (!element) return GST_PAD_PROBE_OK;

  std::cerr << "[pipeline " << ctx->pipeline_name << "] EOS from inter-pipeline element "
            << GST_OBJECT_NAME(element) << ", restarting it\n";

  // State changes are not allowed from the streaming thread.
  auto stopping = ctx->stopping;
  std::thread([element, stopping]() {
    if (!stopping->load()) {
      gst_element_set_state(element, GST_STATE_NULL);
      if (!stopping->load()) gst_element_sync_state_with_parent(element);
    }
    gst_object_unref(element);
  }).detach();

  return GST_PAD_PROBE_DROP;
}

} // namespace

const char* pipeline_state_name(PipelineState s) {
  switch (s) {
    case PipelineState::Constructed: return "Constructed";
    case PipelineState::Running:     return "Running";
    case PipelineState::Stopped:     return "Stopped";
    default:                         return "Unknown";
  }
}

PipelineHandle::PipelineHandle(std::string name, GstElement* pipeline, int stop_timeout_ms)
  : name_(std::move(name)),
    pipeline_(pipeline),
    stop_timeout_ms_(stop_timeout_ms),
    stopping_(std::make_shared<std::atomic<bool>>(false)) {
  if (!pipeline_) {
    throw LaunchError(ErrorKind::ConstructionError,
                      "pipeline '" + name_ + "': no runtime object", name_);
  }
  gst_object_ref_sink(pipeline_);
  index_elements();
}

PipelineHandle::~PipelineHandle() {
  std::string err;
  if (!stop(err)) {
    std::cerr << "[WARN] pipeline " << name_ << ": " << err << "\n";
  }
  for (auto& kv : elements_) gst_object_unref(kv.second);
  elements_.clear();
  gst_object_unref(pipeline_);
}

void PipelineHandle::index_elements() {
  GstIterator* it = gst_bin_iterate_recurse(GST_BIN(pipeline_));
  GValue item = G_VALUE_INIT;
  bool done = false;
  while (!done) {
    switch (gst_iterator_next(it, &item)) {
      case GST_ITERATOR_OK: {
        auto* e = GST_ELEMENT(g_value_get_object(&item));
        const char* n = GST_OBJECT_NAME(e);
        if (n && elements_.find(n) == elements_.end()) {
          elements_.emplace(n, GST_ELEMENT(gst_object_ref(e)));
        }
        g_value_reset(&item);
        break;
      }
      case GST_ITERATOR_RESYNC:
        for (auto& kv : elements_) gst_object_unref(kv.second);
        elements_.clear();
        gst_iterator_resync(it);
        break;
      case GST_ITERATOR_ERROR:
      case GST_ITERATOR_DONE:
        done = true;
        break;
    }
  }
  g_value_unset(&item);
  gst_iterator_free(it);
}

GstElement* PipelineHandle::find_element(const std::string& element_name) const {
  auto it = elements_.find(element_name);
  return it == elements_.end() ? nullptr : it->second;
}

std::vector<std::string> PipelineHandle::element_names() const {
  std::vector<std::string> names;
  names.reserve(elements_.size());
  for (const auto& kv : elements_) names.push_back(kv.first);
  std::sort(names.begin(), names.end());
  return names;
}

void PipelineHandle::start(int timeout_ms) {
  if (state_.load() == PipelineState::Stopped) {
    throw LaunchError(ErrorKind::ConstructionError,
                      "pipeline '" + name_ + "' is stopped and cannot be restarted", name_);
  }

  GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
  if (ret == GST_STATE_CHANGE_ASYNC) {
    GstState cur = GST_STATE_VOID_PENDING;
    GstState pending = GST_STATE_VOID_PENDING;
    ret = gst_element_get_state(pipeline_, &cur, &pending,
                                static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);
    // Still ASYNC after the timeout: the pipeline is waiting for data (e.g. a
    // network source). It keeps transitioning in the background.
  }

  if (ret == GST_STATE_CHANGE_FAILURE) {
    std::ostringstream ss;
    ss << "pipeline '" << name_ << "': failed to reach PLAYING";
    const std::string bus_err = take_bus_error(pipeline_);
    if (!bus_err.empty()) ss << ": " << bus_err;
    std::string stop_err;
    if (!set_state_null_bounded(pipeline_, stop_timeout_ms_, &stop_err)) {
      ss << " (cleanup: " << stop_err << ")";
    }
    state_.store(PipelineState::Stopped);
    throw LaunchError(ErrorKind::ConstructionError, ss.str(), name_);
  }

  state_.store(PipelineState::Running);
}

bool PipelineHandle::stop(std::string& err) {
  PipelineState expected = state_.load();
  if (expected == PipelineState::Stopped) return true;
  mark_stopping();
  // Only one caller performs the transition.
  while (!state_.compare_exchange_weak(expected, PipelineState::Stopped)) {
    if (expected == PipelineState::Stopped) return true;
  }
  return set_state_null_bounded(pipeline_, stop_timeout_ms_, &err);
}

int PipelineHandle::install_intersrc_eos_guard() {
  int count = 0;
  for (const auto& kv : elements_) {
    if (!is_inter_consumer(element_factory_name(kv.second))) continue;
    GstPad* src = gst_element_get_static_pad(kv.second, "src");
    if (!src) continue;
    auto* ctx = new EosGuardCtx{name_, stopping_};
    gst_pad_add_probe(src, GST_PAD_PROBE_TYPE_EVENT_DOWNSTREAM, on_consumer_event, ctx,
                      [](gpointer p) { delete static_cast<EosGuardCtx*>(p); });
    gst_object_unref(src);
    ++count;
  }
  return count;
}

} // namespace gstmulti
