#pragma once

#include <inkwell/result.hpp>
#include <string>

namespace inkwell {
namespace rpc {

constexpr const char* SOCKET_ENV = "INKWELL_SOCKET";

// Compute the default socket path for this inkwell instance:
//   $XDG_RUNTIME_DIR/inkwell/inkwell-<pid>.sock
// Creates the directory if it doesn't exist.
Result<std::string> createSocketPath();

// Export the socket path as $INKWELL_SOCKET so processes started from the
// daemon's environment can discover it.
Result<void> exportSocketPath(const std::string& path);

// $INKWELL_SOCKET, or an error when it is unset.
Result<std::string> discoverSocketPath();

} // namespace rpc
} // namespace inkwell
