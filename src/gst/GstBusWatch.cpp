// src/gst/GstBusWatch.cpp
#include "gstmulti/gst/GstBusWatch.h"

#include <gst/gst.h>

#include <sstream>
#include <string>

namespace gstmulti {
namespace {

std::string gst_structure_to_string_safe(const GstStructure* st) {
  if (!st) return "<null structure>";
  gchar* s = gst_structure_to_string(st);
  if (!s) return "<structure_to_string failed>";
  std::string out = s;
  g_free(s);
  return out;
}

using ParseFn = void (*)(GstMessage*, GError**, gchar**);

void append_gerror(std::ostringstream& ss, GstMessage* msg, ParseFn parse) {
  GError* e = nullptr;
  gchar* dbg = nullptr;
  parse(msg, &e, &dbg);
  ss << ": " << (e ? e->message : "unknown");
  if (dbg && *dbg) ss << " | " << dbg;
  if (e) g_error_free(e);
  if (dbg) g_free(dbg);
}

} // namespace

const char* gst_state_name(int state) {
  switch (static_cast<GstState>(state)) {
    case GST_STATE_VOID_PENDING: return "VOID_PENDING";
    case GST_STATE_NULL:         return "NULL";
    case GST_STATE_READY:        return "READY";
    case GST_STATE_PAUSED:       return "PAUSED";
    case GST_STATE_PLAYING:      return "PLAYING";
    default:                     return "UNKNOWN";
  }
}

std::string gst_message_source_name(GstMessage* msg) {
  if (msg && GST_MESSAGE_SRC(msg) && GST_IS_OBJECT(GST_MESSAGE_SRC(msg)) &&
      GST_OBJECT_NAME(GST_MESSAGE_SRC(msg))) {
    return GST_OBJECT_NAME(GST_MESSAGE_SRC(msg));
  }
  return "<unknown>";
}

std::string gst_message_to_string(GstMessage* msg) {
  if (!msg) return "<null message>";
  std::ostringstream ss;
  const GstMessageType t = GST_MESSAGE_TYPE(msg);
  ss << gst_message_type_get_name(t);

  if (t == GST_MESSAGE_ERROR) {
    append_gerror(ss, msg, gst_message_parse_error);
    return ss.str();
  }
  if (t == GST_MESSAGE_WARNING) {
    append_gerror(ss, msg, gst_message_parse_warning);
    return ss.str();
  }
  if (t == GST_MESSAGE_INFO) {
    append_gerror(ss, msg, gst_message_parse_info);
    return ss.str();
  }
  if (t == GST_MESSAGE_STATE_CHANGED) {
    ss << " src=" << gst_message_source_name(msg);
    GstState old_s, new_s, pend_s;
    gst_message_parse_state_changed(msg, &old_s, &new_s, &pend_s);
    ss << " " << gst_state_name(old_s) << " -> " << gst_state_name(new_s)
       << " (pending " << gst_state_name(pend_s) << ")";
    return ss.str();
  }
  if (t == GST_MESSAGE_EOS) {
    ss << " src=" << gst_message_source_name(msg);
    return ss.str();
  }
  if (t == GST_MESSAGE_LATENCY) {
    ss << " src=" << gst_message_source_name(msg);
    return ss.str();
  }

  const GstStructure* st = gst_message_get_structure(msg);
  if (st) ss << " " << gst_structure_to_string_safe(st);
  return ss.str();
}

std::string take_bus_error(GstElement* pipeline) {
  if (!pipeline) return {};
  GstBus* bus = gst_element_get_bus(pipeline);
  if (!bus) return {};

  std::string first_error;
  while (GstMessage* msg = gst_bus_pop(bus)) {
    if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR && first_error.empty()) {
      first_error = gst_message_source_name(msg) + ": " + gst_message_to_string(msg);
    }
    gst_message_unref(msg);
  }
  gst_object_unref(bus);
  return first_error;
}

} // namespace gstmulti
