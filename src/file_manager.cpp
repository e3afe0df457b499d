#include "file_manager.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace FileManager {

std::string readFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("Not a regular file: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Cannot read file: " + path);
    }

    return buffer.str();
}

bool resolveContained(const std::string& root,
                      const std::string& subdirectory,
                      const std::string& relative,
                      std::string& resolved) {
    fs::path candidate(relative);
    if (candidate.has_root_path()) {
        return false;
    }

    fs::path normalized = candidate.lexically_normal();
    fs::path base = fs::path(subdirectory).lexically_normal();
    if (!base.has_filename()) {
        base = base.parent_path();
    }

    // "static/a/../b" -> "b" relative to "static"; "static/../x" -> "../x"
    fs::path inside = normalized.lexically_relative(base);
    if (inside.empty()) {
        return false;
    }
    for (const auto& part : inside) {
        if (part == "..") {
            return false;
        }
    }

    resolved = (fs::path(root) / normalized).string();
    return true;
}

}
