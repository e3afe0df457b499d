#pragma once

#include <string>

namespace FileManager {

/**
 * @brief Read the whole file in binary mode
 * @param path Path to the file
 * @return File contents, byte for byte
 * @throw std::runtime_error if the path is not a readable regular file
 */
std::string readFile(const std::string& path);

/**
 * @brief Resolve a relative path that must stay inside a subdirectory of root
 * @param root Directory everything is resolved against
 * @param subdirectory Directory (relative to root) the result has to stay in
 * @param relative Untrusted relative path, e.g. "static/css/site.css"
 * @param resolved Output: root joined with the normalized relative path
 * @return false if relative is absolute or escapes subdirectory after normalization
 */
bool resolveContained(const std::string& root,
                      const std::string& subdirectory,
                      const std::string& relative,
                      std::string& resolved);

}
