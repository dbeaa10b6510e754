#include <inkwell/rpc/socket-path.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace inkwell {
namespace rpc {

Result<std::string> createSocketPath() {
    // Determine base directory: $XDG_RUNTIME_DIR or fallback
    std::string baseDir;
    if (auto* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && xdg[0] != '\0') {
        baseDir = xdg;
    } else if (auto* tmpdir = std::getenv("TMPDIR"); tmpdir && tmpdir[0] != '\0') {
        // macOS: TMPDIR is per-user, set by launchd (e.g. /var/folders/.../T/)
        baseDir = tmpdir;
        if (baseDir.back() == '/') {
            baseDir.pop_back();
        }
    } else {
        // Fallback: /tmp/inkwell-<uid>
        baseDir = "/tmp/inkwell-" + std::to_string(getuid());
        if (mkdir(baseDir.c_str(), 0700) != 0 && errno != EEXIST) {
            return Err<std::string>("cannot create " + baseDir + ": " + std::strerror(errno));
        }
    }

    // Create inkwell subdirectory: <baseDir>/inkwell/
    std::string dir = baseDir + "/inkwell";
    if (mkdir(dir.c_str(), 0700) != 0 && errno != EEXIST) {
        return Err<std::string>("cannot create " + dir + ": " + std::strerror(errno));
    }

    // Socket file: inkwell-<pid>.sock
    std::string path = dir + "/inkwell-" + std::to_string(getpid()) + ".sock";
    return Ok(path);
}

Result<void> exportSocketPath(const std::string& path) {
    if (setenv(SOCKET_ENV, path.c_str(), 1) != 0) {
        return Err(std::string("Failed to set ") + SOCKET_ENV);
    }
    return Ok();
}

Result<std::string> discoverSocketPath() {
    const char* env = std::getenv(SOCKET_ENV);
    if (!env || env[0] == '\0') {
        return Err<std::string>(std::string("$") + SOCKET_ENV + " is not set; pass --socket");
    }
    return Ok(std::string(env));
}

} // namespace rpc
} // namespace inkwell
