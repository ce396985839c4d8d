#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <string>

namespace wayfarer {

std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    if (path.size() == 1) return std::string(home);
    if (path[1] == '/' || path[1] == '\\') return std::string(home) + path.substr(1);
    return path;
}

static bool espeak_data_exists(const std::string& base) {
    std::ifstream f(base + "/phontab");
    return f.good();
}

std::string default_espeak_data_path() {
#if defined(__linux__)
    const char* candidates[] = {
        "/usr/share/espeak-ng-data",
        "/usr/lib/x86_64-linux-gnu/espeak-ng-data",
        "/usr/lib/aarch64-linux-gnu/espeak-ng-data",
        "/usr/local/share/espeak-ng-data",
    };
    for (const char* p : candidates) {
        if (espeak_data_exists(p)) return p;
    }
    return "/usr/share/espeak-ng-data";
#elif defined(__APPLE__)
    return "/opt/homebrew/share/espeak-ng-data";
#else
    return "";
#endif
}

} // namespace wayfarer
