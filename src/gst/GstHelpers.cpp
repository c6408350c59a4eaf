// src/gst/GstHelpers.cpp
#include "gstmulti/gst/GstHelpers.h"

#include "gstmulti/gst/GstInit.h"
#include "gstmulti/launch/Errors.h"

#include <gst/gstdebugutils.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace gstmulti {

bool element_exists(const char* factory) {
  gst_init_once();
  GstElementFactory* f = gst_element_factory_find(factory);
  if (f) {
    gst_object_unref(f);
    return true;
  }
  return false;
}

void require_element(const char* factory, const char* context) {
  if (!element_exists(factory)) {
    std::ostringstream ss;
    ss << (context ? context : "<unknown>")
       << ": required GStreamer element not found: " << factory;
    throw LaunchError(ErrorKind::ConstructionError, ss.str());
  }
}

std::string element_factory_name(GstElement* element) {
  if (!element) return {};
  GstElementFactory* f = gst_element_get_factory(element);
  if (!f) return {};
  const gchar* name = gst_plugin_feature_get_name(GST_PLUGIN_FEATURE(f));
  return name ? name : "";
}

std::string clock_time_to_string(GstClockTime t) {
  if (!GST_CLOCK_TIME_IS_VALID(t)) return "none";
  return std::to_string(static_cast<unsigned long long>(t));
}

void value_from_string(GParamSpec* pspec, const std::string& text, GValue* out) {
  const GType type = G_PARAM_SPEC_VALUE_TYPE(pspec);
  g_value_init(out, type);

  if (!gst_value_deserialize(out, text.c_str())) {
    g_value_unset(out);
    std::ostringstream ss;
    ss << "cannot convert '" << text << "' to " << g_type_name(type)
       << " for property '" << pspec->name << "'";
    throw LaunchError(ErrorKind::PropertyRejected, ss.str());
  }

  // g_param_value_validate() returns TRUE when it had to modify the value,
  // i.e. the text was out of the property's range.
  if (g_param_value_validate(pspec, out)) {
    g_value_unset(out);
    std::ostringstream ss;
    ss << "value '" << text << "' is out of range for property '" << pspec->name << "'";
    throw LaunchError(ErrorKind::PropertyRejected, ss.str());
  }
}

std::string value_to_string(const GValue* value) {
  if (!value) return "<null>";
  gchar* s = gst_value_serialize(value);
  if (!s) s = g_strdup_value_contents(value);
  if (!s) return "<unprintable>";
  std::string out = s;
  g_free(s);
  return out;
}

std::string sanitize_name(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (char c : in) {
    const bool ok =
        (c >= 'a' && c <= 'z') ||
        (c >= 'A' && c <= 'Z') ||
        (c >= '0' && c <= '9') ||
        (c == '_' || c == '-');
    out.push_back(ok ? c : '_');
  }
  if (out.empty()) out = "pipeline";
  return out;
}

void maybe_dump_dot(GstElement* pipeline, const std::string& dir, const std::string& tag) {
  if (!pipeline || dir.empty()) return;

  // Tell GStreamer where to dump dot graphs.
  g_setenv("GST_DEBUG_DUMP_DOT_DIR", dir.c_str(), TRUE);

  const std::string t = "gstmulti_" + sanitize_name(tag);
  gst_debug_bin_to_dot_file_with_ts(GST_BIN(pipeline),
                                    GST_DEBUG_GRAPH_SHOW_ALL,
                                    t.c_str());
}

bool set_state_null_bounded(GstElement* element, int timeout_ms, std::string* err) {
  if (!element) return true;

  struct Teardown {
    std::atomic<bool> done{false};
    std::atomic<bool> failed{false};
  };

  GstElement* local = GST_ELEMENT(gst_object_ref(element));
  auto td = std::make_shared<Teardown>();

  std::thread([local, td]() {
    if (gst_element_set_state(local, GST_STATE_NULL) == GST_STATE_CHANGE_FAILURE) {
      td->failed.store(true);
    }
    gst_object_unref(local);
    td->done.store(true);
  }).detach();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!td->done.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  if (!td->done.load()) {
    if (err) *err = "teardown timed out after " + std::to_string(timeout_ms) + " ms";
    return false;
  }
  if (td->failed.load()) {
    if (err) *err = "state change to NULL failed";
    return false;
  }
  return true;
}

} // namespace gstmulti
