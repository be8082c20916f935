#pragma once

#include <string>

namespace platform {

// Empty when neither XDG nor HOME is set. Relative XDG values are ignored.
std::string config_dir();
std::string data_dir();

// Unix socket of the room gateway process. Sockets live in
// XDG_RUNTIME_DIR, or /tmp without one.
std::string bridge_endpoint();

// Unix socket answering status queries.
std::string status_endpoint();

} // namespace platform
