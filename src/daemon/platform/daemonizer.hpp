#pragma once

namespace platform {

// Detach from the controlling terminal; returns in the grandchild only.
void daemonize();

} // namespace platform
