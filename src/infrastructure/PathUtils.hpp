// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace codeshift::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetUserConfigFile();

    /** @brief Searches PATH for an executable. Names containing '/' are checked directly. */
    static bool IsOnPath(const std::string& executable);

    /** @brief Returns a fresh, unique path under the system temp directory. */
    static std::filesystem::path MakeTempPath(const std::string& prefix, const std::string& suffix);
};

} // namespace codeshift::infrastructure
