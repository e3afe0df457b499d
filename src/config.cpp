#include "config.hpp"
#include "file_manager.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T>
T requireField(const json& doc, const char* key) {
    try {
        return doc.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

bool isValidStaticPrefix(const std::string& prefix) {
    return prefix.size() >= 3 && prefix.front() == '/' && prefix.back() == '/';
}

}

ServerSettings parseSettings(const std::string& jsonText, ServerSettings base) {
    json doc;
    try {
        doc = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid JSON in settings: ") + e.what());
    }

    if (!doc.is_object()) {
        throw std::runtime_error("Settings must be a JSON object");
    }

    if (doc.contains("host")) {
        base.host = requireField<std::string>(doc, "host");
    }
    if (doc.contains("port")) {
        int port = requireField<int>(doc, "port");
        if (port < 0 || port > 65535) {
            throw std::runtime_error("Port out of range: " + std::to_string(port));
        }
        base.port = port;
    }
    if (doc.contains("document_root")) {
        base.documentRoot = requireField<std::string>(doc, "document_root");
    }
    if (doc.contains("static_prefix")) {
        std::string prefix = requireField<std::string>(doc, "static_prefix");
        if (!isValidStaticPrefix(prefix)) {
            throw std::runtime_error("static_prefix must look like /name/: " + prefix);
        }
        base.staticPrefix = prefix;
    }
    if (doc.contains("submit_path")) {
        std::string submit = requireField<std::string>(doc, "submit_path");
        if (submit.empty() || submit.front() != '/') {
            throw std::runtime_error("submit_path must start with '/': " + submit);
        }
        base.submitPath = submit;
    }
    if (doc.contains("read_buffer_size")) {
        long long size = requireField<long long>(doc, "read_buffer_size");
        if (size <= 0 || static_cast<unsigned long long>(size) > Config::MAX_READ_BUFFER_SIZE) {
            throw std::runtime_error("read_buffer_size must be between 1 and " +
                                     std::to_string(Config::MAX_READ_BUFFER_SIZE));
        }
        base.readBufferSize = static_cast<size_t>(size);
    }
    if (doc.contains("io_timeout_sec")) {
        int timeout = requireField<int>(doc, "io_timeout_sec");
        if (timeout < 0) {
            throw std::runtime_error("io_timeout_sec cannot be negative");
        }
        base.ioTimeoutSeconds = timeout;
    }

    return base;
}

ServerSettings loadSettings(const std::string& path) {
    return parseSettings(FileManager::readFile(path));
}
