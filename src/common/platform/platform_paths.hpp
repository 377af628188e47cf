#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if neither XDG_CONFIG_HOME nor HOME is set.
std::string config_dir();

// Socket the daemon listens on, one per Wayland display.
std::string ipc_endpoint();

// Socket of the running niri instance ($NIRI_SOCKET). Empty if unset.
std::string niri_socket();

} // namespace platform
