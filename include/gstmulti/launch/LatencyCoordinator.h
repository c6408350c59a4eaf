#pragma once

#include "gstmulti/launch/PipelineRegistry.h"

#include <gst/gst.h>

#include <string>

namespace gstmulti {

struct LatencyRange {
  bool live = false;
  GstClockTime min = 0;
  GstClockTime max = GST_CLOCK_TIME_NONE;
  // Pipeline-level override; GST_CLOCK_TIME_NONE when none is set.
  GstClockTime configured = GST_CLOCK_TIME_NONE;
};

// Runs a LATENCY query on `target`; false when it cannot answer yet.
bool query_latency(GstElement* target, LatencyRange& out);

// Runtime latency and property control over registered pipelines.
//
// Inter-pipeline link elements do not carry latency across the
// producer/consumer boundary, so every operation here acts on exactly one
// pipeline. Propagating a change to a dependent pipeline is an explicit
// set_latency() + push_latency_event() on that pipeline.
class LatencyCoordinator {
public:
  explicit LatencyCoordinator(PipelineRegistry& registry);

  // Aggregate pipeline latency when `element` is empty, otherwise the
  // element's own answer. A pipeline override replaces the queried minimum.
  // Throws LaunchError(NotFound | QueryFailed).
  LatencyRange get_latency(const std::string& pipeline, const std::string& element = {}) const;

  // Pipeline-level override used on the next renegotiation. Does not
  // renegotiate by itself.
  void set_latency(const std::string& pipeline, GstClockTime latency);

  // Sends a latency event carrying `latency` to one element.
  void set_element_latency(const std::string& pipeline,
                           const std::string& element,
                           GstClockTime latency);

  // Recalculates and redistributes latency inside the pipeline now.
  // Throws LaunchError(NotFound | QueryFailed).
  void push_latency_event(const std::string& pipeline);

  // Typed property write, coerced from text through the property's GParamSpec.
  // Returns the value read back after the write.
  // Throws LaunchError(NotFound | PropertyRejected).
  std::string set_property(const std::string& pipeline,
                           const std::string& element,
                           const std::string& property,
                           const std::string& value);

  std::string get_property(const std::string& pipeline,
                           const std::string& element,
                           const std::string& property) const;

  // Selects `pad` as the active pad of a selector-like element.
  void switch_pad(const std::string& pipeline,
                  const std::string& element,
                  const std::string& pad);

private:
  PipelineRegistry& registry_;
};

} // namespace gstmulti
