// src/launch/LatencyCoordinator.cpp
#include "gstmulti/launch/LatencyCoordinator.h"

#include "gstmulti/gst/GstHelpers.h"
#include "gstmulti/launch/Errors.h"

#include <sstream>

namespace gstmulti {
namespace {

GParamSpec* find_property(GstElement* e,
                          const std::string& element,
                          const std::string& property) {
  GParamSpec* pspec = g_object_class_find_property(G_OBJECT_GET_CLASS(e), property.c_str());
  if (!pspec) {
    throw LaunchError(ErrorKind::NotFound,
                      "element '" + element + "' has no property '" + property + "'");
  }
  return pspec;
}

std::string read_property(GstElement* e, GParamSpec* pspec) {
  GValue v = G_VALUE_INIT;
  g_value_init(&v, G_PARAM_SPEC_VALUE_TYPE(pspec));
  g_object_get_property(G_OBJECT(e), pspec->name, &v);
  std::string out = value_to_string(&v);
  g_value_unset(&v);
  return out;
}

// Properties flagged mutable only up to READY/PAUSED refuse writes later on.
void check_mutable_now(GstElement* e, GParamSpec* pspec, const std::string& element) {
  const GstState cur = GST_STATE(e);
  const char* limit = nullptr;
  if ((pspec->flags & GST_PARAM_MUTABLE_READY) && cur > GST_STATE_READY) limit = "READY";
  if ((pspec->flags & GST_PARAM_MUTABLE_PAUSED) && cur > GST_STATE_PAUSED) limit = "PAUSED";
  if (limit) {
    std::ostringstream ss;
    ss << "property '" << pspec->name << "' of element '" << element
       << "' can only be changed up to the " << limit << " state";
    throw LaunchError(ErrorKind::PropertyRejected, ss.str());
  }
}

} // namespace

bool query_latency(GstElement* target, LatencyRange& out) {
  if (!target) return false;
  GstQuery* q = gst_query_new_latency();
  const bool ok = gst_element_query(target, q);
  if (ok) {
    gboolean live = FALSE;
    GstClockTime min = 0;
    GstClockTime max = GST_CLOCK_TIME_NONE;
    gst_query_parse_latency(q, &live, &min, &max);
    out.live = live;
    out.min = min;
    out.max = max;
  }
  gst_query_unref(q);
  return ok;
}

LatencyCoordinator::LatencyCoordinator(PipelineRegistry& registry) : registry_(registry) {}

LatencyRange LatencyCoordinator::get_latency(const std::string& pipeline,
                                             const std::string& element) const {
  LatencyRange r;
  if (!element.empty()) {
    GstElement* e = registry_.lookup_element(pipeline, element);
    if (!query_latency(e, r)) {
      throw LaunchError(ErrorKind::QueryFailed,
                        "element '" + element + "' in pipeline '" + pipeline +
                            "' cannot report latency yet",
                        pipeline);
    }
    return r;
  }

  GstElement* p = registry_.lookup_pipeline(pipeline).pipeline();
  if (!query_latency(p, r)) {
    throw LaunchError(ErrorKind::QueryFailed,
                      "pipeline '" + pipeline + "' cannot report latency yet (not running?)",
                      pipeline);
  }
  r.configured = gst_pipeline_get_latency(GST_PIPELINE(p));
  if (GST_CLOCK_TIME_IS_VALID(r.configured)) {
    // The override replaces whatever the sinks negotiated.
    r.min = r.configured;
  }
  return r;
}

void LatencyCoordinator::set_latency(const std::string& pipeline, GstClockTime latency) {
  if (!GST_CLOCK_TIME_IS_VALID(latency)) {
    throw LaunchError(ErrorKind::PropertyRejected, "latency must be a valid duration", pipeline);
  }
  GstElement* p = registry_.lookup_pipeline(pipeline).pipeline();
  gst_pipeline_set_latency(GST_PIPELINE(p), latency);
}

void LatencyCoordinator::set_element_latency(const std::string& pipeline,
                                             const std::string& element,
                                             GstClockTime latency) {
  GstElement* e = registry_.lookup_element(pipeline, element);
  if (!gst_element_send_event(e, gst_event_new_latency(latency))) {
    throw LaunchError(ErrorKind::PropertyRejected,
                      "element '" + element + "' did not accept the latency event",
                      pipeline);
  }
}

void LatencyCoordinator::push_latency_event(const std::string& pipeline) {
  GstElement* p = registry_.lookup_pipeline(pipeline).pipeline();
  if (!gst_bin_recalculate_latency(GST_BIN(p))) {
    throw LaunchError(ErrorKind::QueryFailed,
                      "pipeline '" + pipeline + "' could not renegotiate latency (not running?)",
                      pipeline);
  }
}

std::string LatencyCoordinator::set_property(const std::string& pipeline,
                                             const std::string& element,
                                             const std::string& property,
                                             const std::string& value) {
  GstElement* e = registry_.lookup_element(pipeline, element);
  GParamSpec* pspec = find_property(e, element, property);

  if (!(pspec->flags & G_PARAM_WRITABLE) || (pspec->flags & G_PARAM_CONSTRUCT_ONLY)) {
    throw LaunchError(ErrorKind::PropertyRejected,
                      "property '" + property + "' of element '" + element + "' is read-only",
                      pipeline);
  }
  check_mutable_now(e, pspec, element);

  GValue v = G_VALUE_INIT;
  value_from_string(pspec, value, &v);
  g_object_set_property(G_OBJECT(e), pspec->name, &v);
  g_value_unset(&v);

  if (!(pspec->flags & G_PARAM_READABLE)) return value;
  return read_property(e, pspec);
}

std::string LatencyCoordinator::get_property(const std::string& pipeline,
                                             const std::string& element,
                                             const std::string& property) const {
  GstElement* e = registry_.lookup_element(pipeline, element);
  GParamSpec* pspec = find_property(e, element, property);
  if (!(pspec->flags & G_PARAM_READABLE)) {
    throw LaunchError(ErrorKind::PropertyRejected,
                      "property '" + property + "' of element '" + element + "' is write-only",
                      pipeline);
  }
  return read_property(e, pspec);
}

void LatencyCoordinator::switch_pad(const std::string& pipeline,
                                    const std::string& element,
                                    const std::string& pad) {
  GstElement* e = registry_.lookup_element(pipeline, element);
  GParamSpec* pspec = g_object_class_find_property(G_OBJECT_GET_CLASS(e), "active-pad");
  if (!pspec || !(pspec->flags & G_PARAM_WRITABLE)) {
    throw LaunchError(ErrorKind::PropertyRejected,
                      "element '" + element + "' has no writable 'active-pad' property",
                      pipeline);
  }
  GstPad* p = gst_element_get_static_pad(e, pad.c_str());
  if (!p) {
    throw LaunchError(ErrorKind::NotFound,
                      "element '" + element + "' has no pad '" + pad + "'", pipeline);
  }
  g_object_set(G_OBJECT(e), "active-pad", p, nullptr);
  gst_object_unref(p);
}

} // namespace gstmulti
