#pragma once

#include <string>
#include <filesystem>

namespace fvgscan {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable, falling back to the working directory
    static std::filesystem::path getExecutableDir();
    
    // Relative paths resolve against the working directory first, then the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // Absolute paths as given, anything else through resolveRelativePath
    static std::filesystem::path resolvePath(const std::string& path);
};

} // namespace utils
} // namespace fvgscan
