#include "mime_types.hpp"
#include <map>

namespace {

const std::map<std::string, std::string>& mimeTable() {
    static const std::map<std::string, std::string> table = {
        {"html", "text/html"},
        {"css", "text/css"},
        {"js", "application/javascript"},
        {"json", "application/json"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"txt", "text/plain"},
    };
    return table;
}

}

std::string mimeTypeFor(const std::string& path) {
    size_t dot = path.rfind('.');
    if (dot == std::string::npos) {
        return "application/octet-stream";
    }

    auto it = mimeTable().find(path.substr(dot + 1));
    return it != mimeTable().end() ? it->second : "application/octet-stream";
}
