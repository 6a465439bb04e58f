#pragma once

#include <string>
#include <filesystem>

namespace tradebots {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable
    static std::filesystem::path getExecutableDir();

    // Relative paths are taken from the executable directory;
    // absolute paths are returned unchanged.
    static std::filesystem::path resolveRelativePath(const std::string& path);
};

} // namespace utils
} // namespace tradebots
