#pragma once

#include "gstmulti/launch/LaunchOptions.h"
#include "gstmulti/launch/PipelineHandle.h"
#include "gstmulti/launch/PipelineSpec.h"

#include <gst/gst.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace gstmulti {

// Process-wide name -> pipeline map for one session. Written only while the
// session starts up (single writer), read concurrently afterwards. Apart from
// the startup rollback, handles are never removed individually; teardown()
// drops all of them at once.
class PipelineRegistry {
public:
  explicit PipelineRegistry(const LaunchOptions& opt = {});
  ~PipelineRegistry();

  PipelineRegistry(const PipelineRegistry&) = delete;
  PipelineRegistry& operator=(const PipelineRegistry&) = delete;

  // Realizes the graph description and indexes its elements.
  // Throws LaunchError(ConstructionError) on a name collision or a graph the
  // engine rejects (unknown element, bad link, bad property).
  PipelineHandle& register_pipeline(const PipelineSpec& spec);

  // Throw LaunchError(NotFound). Pipelines that were already stopped are
  // reported as not found.
  PipelineHandle& lookup_pipeline(const std::string& name) const;
  GstElement* lookup_element(const std::string& pipeline_name,
                             const std::string& element_name) const;

  // Every registered handle in registration order, stopped ones included.
  std::vector<PipelineHandle*> all() const;
  size_t size() const { return handles_.size(); }
  bool contains(const std::string& name) const;

  // Stops and destroys every pipeline (reverse registration order).
  void teardown();

private:
  friend class Supervisor;

  // Startup rollback: drops the most recent registration when it failed to
  // start, so a pipeline that never ran is not left behind.
  void discard_last(const std::string& name);

  GstElement* realize(const PipelineSpec& spec) const;
  void attach_clock(GstElement* pipeline);

  LaunchOptions opt_;
  std::vector<std::unique_ptr<PipelineHandle>> handles_;
  std::unordered_map<std::string, PipelineHandle*> by_name_;
  GstClock* clock_ = nullptr;
  GstClockTime base_time_ = GST_CLOCK_TIME_NONE;
};

} // namespace gstmulti
