// src/gst/GstInit.cpp
#include "gstmulti/gst/GstInit.h"

#include <gst/gst.h>

#include <mutex>

namespace gstmulti {

void gst_init_once() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (gst_is_initialized()) return;
    int argc = 0;
    char** argv = nullptr;
    gst_init(&argc, &argv);
  });
}

} // namespace gstmulti
