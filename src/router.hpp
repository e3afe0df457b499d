#pragma once

#include "config.hpp"
#include "http_types.hpp"
#include "logger.hpp"
#include "static_files.hpp"
#include <string>

class Router {
private:
    StaticMount staticMount;
    std::string submitPath;
    LogSink& log;

public:
    Router(const ServerSettings& settings, LogSink& sink);

    // Every request maps to exactly one response; nothing here throws.
    Response route(const Request& req) const;
};
