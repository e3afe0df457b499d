#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <string>

namespace Config {
    static constexpr const char* VERSION = "1.0";
    static constexpr int PORT = 8080;
    static constexpr const char* HOST = "127.0.0.1";
    static constexpr const char* DOCUMENT_ROOT = "./";
    static constexpr const char* STATIC_PREFIX = "/static/";
    static constexpr const char* SUBMIT_PATH = "/submit";
    static constexpr size_t READ_BUFFER_SIZE = 4096;
    static constexpr size_t MAX_READ_BUFFER_SIZE = 1024 * 1024;
    static constexpr int IO_TIMEOUT_SEC = 0;
    static constexpr int LISTEN_BACKLOG = 128;
    static constexpr int ACCEPT_RETRY_DELAY_MS = 100;
}

struct ServerSettings {
    std::string host = Config::HOST;
    int port = Config::PORT;
    std::string documentRoot = Config::DOCUMENT_ROOT;
    std::string staticPrefix = Config::STATIC_PREFIX;
    std::string submitPath = Config::SUBMIT_PATH;
    // Requests longer than this are cut off after the single read.
    size_t readBufferSize = Config::READ_BUFFER_SIZE;
    // 0 keeps reads and writes blocking forever.
    int ioTimeoutSeconds = Config::IO_TIMEOUT_SEC;
};

/**
 * @brief Load settings from a JSON file, starting from the Config defaults
 * @param path Path to the JSON file
 * @return Settings with every recognised key applied
 * @throw std::runtime_error if the file is unreadable, not JSON, or holds invalid values
 */
ServerSettings loadSettings(const std::string& path);

/**
 * @brief Apply a JSON document on top of existing settings
 * @throw std::runtime_error on type or range errors
 */
ServerSettings parseSettings(const std::string& jsonText, ServerSettings base = ServerSettings());

#endif
