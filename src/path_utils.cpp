#include "path_utils.h"
#include <cstdlib>
#include <string>
#include <unistd.h>

namespace helios {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::string executable_dir() {
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) return "";
    buf[len] = '\0';
    std::string exe_path(buf);
    size_t pos = exe_path.find_last_of('/');
    if (pos == std::string::npos) return "";
    return exe_path.substr(0, pos);
}

} // namespace helios
