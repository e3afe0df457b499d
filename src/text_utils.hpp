#pragma once

#include <string>
#include <vector>

/**
 * @brief Decode raw socket bytes as UTF-8, replacing every invalid sequence with U+FFFD
 */
std::string decodeUtf8Lossy(const std::string& bytes);

bool isValidUtf8(const std::string& text);

/**
 * @brief Split text into lines on '\n'
 *
 * One trailing '\r' is removed from each line. A '\n' at the very end does not
 * start another (empty) line, so "" has no lines and "a\n" has one.
 */
std::vector<std::string> splitLines(const std::string& text);

bool startsWith(const std::string& text, const std::string& prefix);
