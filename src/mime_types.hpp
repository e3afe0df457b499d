#pragma once

#include <string>

// Content type for the text after the last '.' in path; application/octet-stream if unknown.
std::string mimeTypeFor(const std::string& path);
