#include "common/PathUtils.h"
#include <system_error>

namespace tradebots {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    std::filesystem::path exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        // Not on procfs: fall back to the working directory
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p;
    }
    return getExecutableDir() / p;
}

} // namespace utils
} // namespace tradebots
