#pragma once

#include "http_types.hpp"
#include "logger.hpp"
#include <string>

/**
 * @brief Handle a POST by echoing the body back according to its Content-Type
 * @param req Parsed request
 * @param submitPath The only path that accepts submissions
 * @param log Sink for per-request messages
 * @return 200 for JSON or form bodies, 415 for any other or missing type, 404 for other paths
 */
Response handlePost(const Request& req, const std::string& submitPath, LogSink& log);
