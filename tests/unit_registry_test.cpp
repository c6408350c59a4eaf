#include "gstmulti/gst/GstInit.h"
#include "gstmulti/launch/Errors.h"
#include "gstmulti/launch/PipelineRegistry.h"

#include "test_utils.h"

#include <gst/gst.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using gstmulti::ErrorKind;
using gstmulti::PipelineSpec;

static PipelineSpec make_spec(const std::string& name, const std::string& graph) {
  PipelineSpec s;
  s.name = name;
  std::istringstream in(graph);
  std::string tok;
  while (in >> tok) s.graph_tokens.push_back(tok);
  return s;
}

int main() {
  try {
    gstmulti::gst_init_once();

    gstmulti::LaunchOptions opt;
    opt.restart_intersrc_on_eos = false;
    gstmulti::PipelineRegistry reg(opt);

    auto& a = reg.register_pipeline(
        make_spec("video_link_0", "fakesrc name=src ! queue name=ingress_raw_video_queue ! fakesink name=sink"));
    require(a.name() == "video_link_0", "handle name");
    require(a.state() == gstmulti::PipelineState::Constructed, "new handle is Constructed");
    require(GST_IS_PIPELINE(a.pipeline()), "runtime object is a pipeline");
    require(std::string(GST_OBJECT_NAME(a.pipeline())) == "video_link_0", "pipeline carries its name");
    require(a.find_element("ingress_raw_video_queue") != nullptr, "queue indexed");
    require(a.find_element("missing") == nullptr, "unknown element not indexed");
    {
      const auto names = a.element_names();
      require(names == std::vector<std::string>({"ingress_raw_video_queue", "sink", "src"}),
              "element_names sorted");
    }

    // Elements inside a nested bin are reachable by name.
    auto& b = reg.register_pipeline(make_spec(
        "nested", "fakesrc name=outer_src ! fakesink name=outer_sink "
                  "( fakesrc name=inner_src ! fakesink name=inner_sink )"));
    require(b.find_element("inner_src") != nullptr, "nested element indexed");
    require(b.find_element("outer_sink") != nullptr, "top-level element indexed");

    // A single element comes back bare from the parser and gets wrapped.
    auto& c = reg.register_pipeline(make_spec("lonely", "fakesink name=only"));
    require(GST_IS_PIPELINE(c.pipeline()), "single element wrapped in a pipeline");
    require(c.find_element("only") != nullptr, "wrapped element indexed");

    {
      auto e = require_launch_error(
          [&] { reg.register_pipeline(make_spec("video_link_0", "fakesrc ! fakesink")); },
          ErrorKind::ConstructionError, "duplicate name");
      require(e.pipeline() == "video_link_0", "duplicate names the pipeline");
      require(&reg.lookup_pipeline("video_link_0") == &a, "first registration kept");
    }
    {
      auto e = require_launch_error(
          [&] { reg.register_pipeline(make_spec("broken", "fakesrc ! no_such_element_xyz ! fakesink")); },
          ErrorKind::ConstructionError, "unknown element");
      require(e.pipeline() == "broken", "construction error names the pipeline");
      require(!reg.contains("broken"), "failed pipeline not registered");
    }

    require(reg.size() == 3, "three pipelines registered");
    {
      const auto all = reg.all();
      require(all.size() == 3 && all[0] == &a && all[1] == &b && all[2] == &c,
              "all() keeps registration order");
    }

    require(reg.lookup_element("video_link_0", "sink") == a.find_element("sink"), "lookup_element");
    require_launch_error([&] { reg.lookup_pipeline("video_link_9"); },
                         ErrorKind::NotFound, "unknown pipeline");
    require_launch_error([&] { reg.lookup_element("video_link_0", "inner_src"); },
                         ErrorKind::NotFound, "element from another pipeline");
    require_launch_error([&] { reg.lookup_element("nope", "sink"); },
                         ErrorKind::NotFound, "element of unknown pipeline");

    {
      std::string err;
      require(c.stop(err), "stop of a never started pipeline");
      require(c.state() == gstmulti::PipelineState::Stopped, "stopped handle");
      require(c.stop(err), "second stop is a no-op");
      require_launch_error([&] { reg.lookup_pipeline("lonely"); },
                           ErrorKind::NotFound, "stopped pipeline is not found");
      require(reg.contains("lonely"), "stopped pipeline stays registered");
    }

    reg.teardown();
    require(reg.size() == 0, "teardown empties the registry");

    std::cout << "[OK] unit_registry_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
