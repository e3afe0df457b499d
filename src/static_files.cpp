#include "static_files.hpp"
#include "file_manager.hpp"
#include "mime_types.hpp"
#include "text_utils.hpp"
#include <stdexcept>

namespace {

std::string stripLeadingSlash(const std::string& path) {
    return (!path.empty() && path[0] == '/') ? path.substr(1) : path;
}

}

Response serveStaticFile(const std::string& requestPath, const StaticMount& mount, LogSink& log) {
    std::string relative = stripLeadingSlash(requestPath);
    std::string file_path;

    if (!FileManager::resolveContained(mount.root, stripLeadingSlash(mount.prefix), relative, file_path)) {
        log.warn("STATIC", "Rejected path outside " + mount.prefix + ": " + requestPath);
        return makeResponse(403, "403 Forbidden");
    }

    std::string content;
    try {
        content = FileManager::readFile(file_path);
    } catch (const std::runtime_error& e) {
        log.warn("STATIC", e.what());
        return makeResponse(404, "404 File Not Found");
    }

    if (!isValidUtf8(content)) {
        log.warn("STATIC", "Not valid UTF-8 text: " + file_path);
        return makeResponse(404, "404 File Not Found");
    }

    log.info("STATIC", "Served " + file_path + " (" + std::to_string(content.size()) + " bytes)");
    return makeResponse(200, content, mimeTypeFor(file_path));
}
