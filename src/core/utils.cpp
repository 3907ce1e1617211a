#include "utils.hpp"
#include <platform/platform.hpp>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}
