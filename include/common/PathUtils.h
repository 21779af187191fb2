#pragma once

#include <string>
#include <filesystem>

namespace daypilot {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (falls back to CWD)
    static std::filesystem::path getExecutableDir();

    // Relative paths are tried against CWD first, then the executable dir
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace daypilot
