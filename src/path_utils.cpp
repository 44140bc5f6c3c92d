#include "path_utils.h"
#include <cstdlib>
#include <string>

namespace interrupt_filter {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::string resolve_relative(const std::string& base_dir, const std::string& path) {
    if (path.empty()) return path;
    if (path[0] == '/' || path[0] == '~') return expand_path(path);
    if (base_dir.empty()) return path;
    if (base_dir.back() == '/') return base_dir + path;
    return base_dir + "/" + path;
}

std::string parent_dir(const std::string& path) {
    std::string::size_type pos = path.find_last_of('/');
    if (pos == std::string::npos) return "";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

} // namespace interrupt_filter
