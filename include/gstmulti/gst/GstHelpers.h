// include/gstmulti/gst/GstHelpers.h
#pragma once

#include <glib-object.h>
#include <gst/gst.h>

#include <string>

namespace gstmulti {

bool element_exists(const char* factory);

void require_element(const char* factory, const char* context);

// Factory name of an element ("queue", "intervideosrc", ...), empty if unknown.
std::string element_factory_name(GstElement* element);

// Nanoseconds as decimal text, "none" for GST_CLOCK_TIME_NONE.
std::string clock_time_to_string(GstClockTime t);

// Coerces text into `out` according to the property's declared type.
// `out` must be zero-initialized; on success it holds an initialized value the
// caller must g_value_unset(). Throws LaunchError(PropertyRejected).
void value_from_string(GParamSpec* pspec, const std::string& text, GValue* out);

// Serializes a GValue for display (falls back to GLib's debug rendering).
std::string value_to_string(const GValue* value);

std::string sanitize_name(const std::string& in);

// Writes <dir>/<timestamp>-gstmulti_<tag>.dot when dir is non-empty.
void maybe_dump_dot(GstElement* pipeline, const std::string& dir, const std::string& tag);

// Moves the element to NULL on a helper thread and waits at most timeout_ms.
// Returns false (and fills *err) when the transition failed or did not finish
// in time; the helper keeps its own reference, so a stuck element is leaked
// instead of hanging the caller.
bool set_state_null_bounded(GstElement* element, int timeout_ms, std::string* err = nullptr);

} // namespace gstmulti
