#include "infrastructure/PathUtils.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace codeshift::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetUserConfigFile() {
    return GetConfigHome() / "codeshift" / "settings.json";
}

bool PathUtils::IsOnPath(const std::string& executable) {
    if (executable.empty()) return false;
    if (executable.find('/') != std::string::npos) {
        return ::access(executable.c_str(), X_OK) == 0;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv || !*pathEnv) return false;

    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / executable;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

fs::path PathUtils::MakeTempPath(const std::string& prefix, const std::string& suffix) {
    static std::atomic<unsigned> counter{0};
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = prefix + std::to_string(::getpid()) + "_" + std::to_string(now) + "_" +
                       std::to_string(counter++) + suffix;
    return fs::temp_directory_path() / name;
}

} // namespace codeshift::infrastructure
