#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace live_scribe {

namespace {

const char* DEFAULT_CONFIG_PATH = "config/config.json";

bool file_readable(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

} // namespace

std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~user

    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

std::string executable_dir() {
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) return "";
    buf[len] = '\0';

    std::string exe(buf);
    size_t pos = exe.find_last_of('/');
    if (pos == std::string::npos) return "";
    return exe.substr(0, pos);
}

std::string resolve_config_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) return expand_path(explicit_path);

    std::string dir = executable_dir();
    if (!dir.empty()) {
        std::string candidate = dir + "/../" + DEFAULT_CONFIG_PATH;
        if (file_readable(candidate)) return candidate;
    }
    return DEFAULT_CONFIG_PATH;
}

} // namespace live_scribe
