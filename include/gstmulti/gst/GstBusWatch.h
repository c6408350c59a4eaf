#pragma once

#include <string>

struct _GstElement;
struct _GstMessage;
typedef struct _GstElement GstElement;
typedef struct _GstMessage GstMessage;

namespace gstmulti {

std::string gst_message_to_string(GstMessage* msg);

// Name of the object that posted the message, "<unknown>" when it has none.
std::string gst_message_source_name(GstMessage* msg);

// Human-readable GstState name ("NULL", "PLAYING", ...).
const char* gst_state_name(int state);

// Pops every pending message off the pipeline bus and returns the first
// ERROR line found, or an empty string. Used after a failed state change to
// explain why it failed.
std::string take_bus_error(GstElement* pipeline);

} // namespace gstmulti
