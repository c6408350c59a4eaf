// src/launch/PipelineRegistry.cpp
#include "gstmulti/launch/PipelineRegistry.h"

#include "gstmulti/gst/GstInit.h"
#include "gstmulti/launch/Errors.h"

#include <iostream>
#include <sstream>
#include <utility>

namespace gstmulti {

PipelineRegistry::PipelineRegistry(const LaunchOptions& opt) : opt_(opt) {
  gst_init_once();
}

PipelineRegistry::~PipelineRegistry() {
  teardown();
  if (clock_) gst_object_unref(clock_);
}

GstElement* PipelineRegistry::realize(const PipelineSpec& spec) const {
  const std::string desc = spec.description();
  GError* err = nullptr;
  GstElement* e = gst_parse_launch_full(desc.c_str(), nullptr, GST_PARSE_FLAG_FATAL_ERRORS, &err);

  if (err || !e) {
    std::ostringstream ss;
    ss << "pipeline '" << spec.name << "': "
       << (err && err->message ? err->message : "could not build graph");
    if (err) g_error_free(err);
    if (e) gst_object_unref(gst_object_ref_sink(e));
    throw LaunchError(ErrorKind::ConstructionError, ss.str(), spec.name);
  }

  // A single-element description comes back bare; wrap it so every handle
  // owns a real pipeline.
  if (!GST_IS_PIPELINE(e)) {
    GstElement* p = gst_pipeline_new(nullptr);
    gst_bin_add(GST_BIN(p), e);
    e = p;
  }
  gst_object_set_name(GST_OBJECT(e), spec.name.c_str());
  return e;
}

void PipelineRegistry::attach_clock(GstElement* pipeline) {
  if (!opt_.shared_clock) return;
  if (!clock_) {
    clock_ = gst_system_clock_obtain();
    base_time_ = gst_clock_get_time(clock_);
  }
  // Pipelines linked through inter-pipeline elements must agree on running time.
  gst_pipeline_use_clock(GST_PIPELINE(pipeline), clock_);
  gst_element_set_start_time(pipeline, GST_CLOCK_TIME_NONE);
  gst_element_set_base_time(pipeline, base_time_);
}

PipelineHandle& PipelineRegistry::register_pipeline(const PipelineSpec& spec) {
  if (spec.name.empty()) {
    throw LaunchError(ErrorKind::ConstructionError, "pipeline name must not be empty");
  }
  if (contains(spec.name)) {
    throw LaunchError(ErrorKind::ConstructionError,
                      "pipeline name '" + spec.name + "' is already registered", spec.name);
  }

  GstElement* pipeline = realize(spec);
  auto handle = std::make_unique<PipelineHandle>(spec.name, pipeline, opt_.stop_timeout_ms);
  attach_clock(handle->pipeline());
  if (opt_.restart_intersrc_on_eos) {
    const int guarded = handle->install_intersrc_eos_guard();
    if (opt_.verbose && guarded > 0) {
      std::cerr << "[registry] " << spec.name << ": guarding " << guarded
                << " inter-pipeline source(s) against EOS\n";
    }
  }

  if (opt_.verbose) {
    std::cerr << "[registry] " << spec.name << ": " << handle->element_names().size()
              << " named elements\n";
  }

  PipelineHandle& ref = *handle;
  by_name_.emplace(spec.name, handle.get());
  handles_.push_back(std::move(handle));
  return ref;
}

PipelineHandle& PipelineRegistry::lookup_pipeline(const std::string& name) const {
  auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    throw LaunchError(ErrorKind::NotFound, "pipeline '" + name + "' not found", name);
  }
  if (it->second->state() == PipelineState::Stopped) {
    throw LaunchError(ErrorKind::NotFound, "pipeline '" + name + "' is stopped", name);
  }
  return *it->second;
}

GstElement* PipelineRegistry::lookup_element(const std::string& pipeline_name,
                                             const std::string& element_name) const {
  PipelineHandle& h = lookup_pipeline(pipeline_name);
  GstElement* e = h.find_element(element_name);
  if (!e) {
    throw LaunchError(ErrorKind::NotFound,
                      "element '" + element_name + "' not found in pipeline '" + pipeline_name + "'",
                      pipeline_name);
  }
  return e;
}

std::vector<PipelineHandle*> PipelineRegistry::all() const {
  std::vector<PipelineHandle*> out;
  out.reserve(handles_.size());
  for (const auto& h : handles_) out.push_back(h.get());
  return out;
}

bool PipelineRegistry::contains(const std::string& name) const {
  return by_name_.find(name) != by_name_.end();
}

void PipelineRegistry::discard_last(const std::string& name) {
  if (handles_.empty() || handles_.back()->name() != name) return;
  by_name_.erase(name);
  handles_.pop_back();
}

void PipelineRegistry::teardown() {
  by_name_.clear();
  while (!handles_.empty()) {
    handles_.pop_back();
  }
}

} // namespace gstmulti
