#pragma once

#include <string>
#include <filesystem>

namespace peakrev {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Resolve a path relative to the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace peakrev
