#pragma once

namespace gstmulti {

// Initializes GStreamer exactly once per process (thread-safe).
void gst_init_once();

} // namespace gstmulti
