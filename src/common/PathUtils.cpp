#include "common/PathUtils.h"

#include <system_error>

namespace harvestcast {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::filesystem::path path(relative_path);
    if (path.is_absolute()) {
        return path;
    }
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return std::filesystem::absolute(path, ec);
    }
    return getExecutableDir() / path;
}

} // namespace utils
} // namespace harvestcast
