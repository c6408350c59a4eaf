#pragma once

#include <gst/gst.h>

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace gstmulti {

// Constructed -> Running -> Stopped. Stopped is terminal.
enum class PipelineState {
  Constructed,
  Running,
  Stopped,
};

const char* pipeline_state_name(PipelineState s);

// Exclusive owner of one realized GStreamer pipeline plus an index of its
// named elements (nested bins included). The destructor always moves the
// pipeline to NULL before dropping it.
class PipelineHandle {
public:
  // Takes ownership of `pipeline`; a floating reference is sunk.
  PipelineHandle(std::string name, GstElement* pipeline, int stop_timeout_ms = 2000);
  ~PipelineHandle();

  PipelineHandle(const PipelineHandle&) = delete;
  PipelineHandle& operator=(const PipelineHandle&) = delete;

  const std::string& name() const { return name_; }
  GstElement* pipeline() const { return pipeline_; }
  PipelineState state() const { return state_.load(); }
  bool stopping() const { return stopping_->load(); }

  // nullptr when no element of that name exists in the graph.
  GstElement* find_element(const std::string& element_name) const;
  std::vector<std::string> element_names() const;

  // PLAYING, waiting up to timeout_ms for an asynchronous transition.
  // Throws LaunchError(ConstructionError) when the engine refuses.
  void start(int timeout_ms);

  // NULL, tolerating an already stopped pipeline. Returns false and fills
  // `err` on failure; the handle is Stopped either way.
  bool stop(std::string& err);

  // Marks the pipeline as shutting down (disables the inter-pipeline EOS guard).
  void mark_stopping() { stopping_->store(true); }

  // Adds an EOS guard to every inter-pipeline consumer element; returns how many.
  int install_intersrc_eos_guard();

private:
  void index_elements();

  std::string name_;
  GstElement* pipeline_ = nullptr;
  int stop_timeout_ms_ = 2000;
  std::unordered_map<std::string, GstElement*> elements_;
  std::atomic<PipelineState> state_{PipelineState::Constructed};
  std::shared_ptr<std::atomic<bool>> stopping_;
};

} // namespace gstmulti
