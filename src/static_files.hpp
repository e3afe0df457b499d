#pragma once

#include "http_types.hpp"
#include "logger.hpp"
#include <string>

struct StaticMount {
    std::string prefix;   // URL prefix, e.g. "/static/"
    std::string root;     // directory request paths are resolved against
};

/**
 * @brief Serve a file for a request path that starts with mount.prefix
 *
 * The leading '/' is dropped and the rest is resolved under mount.root.
 * Paths that normalize to somewhere outside the prefix directory get 403.
 * Anything that cannot be read as UTF-8 text gets 404.
 */
Response serveStaticFile(const std::string& requestPath, const StaticMount& mount, LogSink& log);
