#pragma once

#include "http_types.hpp"
#include <string>

/**
 * @brief Parse one request out of the text read from a connection
 *
 * Never fails: missing request-line tokens become empty strings, header lines
 * without ": " are dropped, and the body is everything after the first empty
 * line joined with '\n'. Content-Length is not consulted.
 */
Request parseHTTPRequest(const std::string& raw);
