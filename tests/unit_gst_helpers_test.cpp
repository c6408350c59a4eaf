#include "gstmulti/gst/GstBusWatch.h"
#include "gstmulti/gst/GstHelpers.h"
#include "gstmulti/gst/GstInit.h"
#include "gstmulti/launch/Errors.h"

#include "test_utils.h"

#include <gst/gst.h>

#include <iostream>
#include <string>

using gstmulti::ErrorKind;

int main() {
  try {
    gstmulti::gst_init_once();
    gstmulti::gst_init_once();

    require(gstmulti::element_exists("queue"), "queue element missing");
    require(!gstmulti::element_exists("no_such_element_xyz"), "bogus element reported");
    gstmulti::require_element("fakesink", "unit_gst_helpers_test");
    require_launch_error([] { gstmulti::require_element("no_such_element_xyz", "test"); },
                         ErrorKind::ConstructionError, "require_element on a missing factory");

    require(gstmulti::clock_time_to_string(GST_CLOCK_TIME_NONE) == "none", "none time");
    require(gstmulti::clock_time_to_string(5919 * GST_MSECOND) == "5919000000", "ns time");
    require(gstmulti::sanitize_name("video link/0") == "video_link_0", "sanitize_name");
    require(gstmulti::sanitize_name("") == "pipeline", "sanitize_name empty");
    require(std::string(gstmulti::gst_state_name(GST_STATE_PLAYING)) == "PLAYING", "state name");

    GstElement* queue = gst_element_factory_make("queue", "q");
    require(queue != nullptr, "queue not created");
    gst_object_ref_sink(queue);
    require(gstmulti::element_factory_name(queue) == "queue", "factory name");

    {
      GParamSpec* pspec = g_object_class_find_property(G_OBJECT_GET_CLASS(queue), "max-size-buffers");
      GValue v = G_VALUE_INIT;
      gstmulti::value_from_string(pspec, "42", &v);
      require(g_value_get_uint(&v) == 42u, "uint coerced");
      require(gstmulti::value_to_string(&v) == "42", "uint serialized");
      g_value_unset(&v);

      GValue bad = G_VALUE_INIT;
      require_launch_error([&] { gstmulti::value_from_string(pspec, "lots", &bad); },
                           ErrorKind::PropertyRejected, "non-numeric text");
      require(!G_IS_VALUE(&bad), "rejected value left unset");
    }
    {
      GParamSpec* pspec = g_object_class_find_property(G_OBJECT_GET_CLASS(queue), "leaky");
      GValue v = G_VALUE_INIT;
      gstmulti::value_from_string(pspec, "downstream", &v);
      require(g_value_get_enum(&v) == 2, "enum coerced from nick");
      g_value_unset(&v);
    }

    std::string err;
    require(gstmulti::set_state_null_bounded(queue, 1000, &err), "bounded stop: " + err);
    gst_object_unref(queue);

    GstElement* pipeline = gst_parse_launch("fakesrc num-buffers=1 ! fakesink", nullptr);
    require(pipeline != nullptr, "gst_parse_launch failed");
    gst_element_set_state(pipeline, GST_STATE_PLAYING);
    GstBus* bus = gst_element_get_bus(pipeline);
    GstMessage* msg = gst_bus_timed_pop_filtered(bus, 5 * GST_SECOND, GST_MESSAGE_EOS);
    require(msg != nullptr, "no EOS");
    require_contains(gstmulti::gst_message_to_string(msg), "eos", "EOS rendered");
    gst_message_unref(msg);
    gst_object_unref(bus);
    require(gstmulti::take_bus_error(pipeline).empty(), "no error on a clean run");
    require(gstmulti::set_state_null_bounded(pipeline, 2000, &err), "pipeline stop: " + err);
    gst_object_unref(pipeline);

    std::cout << "[OK] unit_gst_helpers_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
