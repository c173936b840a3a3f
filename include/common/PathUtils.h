#pragma once

#include <string>
#include <filesystem>

namespace harvestcast {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable
    static std::filesystem::path getExecutableDir();

    // Absolute paths pass through. Relative paths resolve against the working
    // directory when they exist there, otherwise against the executable dir.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace harvestcast
