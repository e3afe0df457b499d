#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "router.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

class HTTPServer {
private:
    ServerSettings settings;
    const Router& router;
    LogSink& log;

    int listenSocket;
    int boundPort;
    std::atomic<bool> stopping;

    std::mutex connectionsMutex;
    std::condition_variable connectionsDone;
    size_t activeConnections;

    void handleConnection(int clientSocket, const std::string& peer);
    void applyTimeouts(int clientSocket);
    void connectionFinished();

public:
    HTTPServer(const ServerSettings& settings, const Router& router, LogSink& log);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    /**
     * @brief Create, bind and listen on settings.host:settings.port
     * @return The port actually bound (useful when settings.port is 0)
     * @throw std::runtime_error if any step fails or readBufferSize is out of range
     */
    int bindAndListen();

    /**
     * @brief Accept connections until stop() is called
     *
     * Every accepted connection is handled on its own detached thread. Returns
     * once the listener is shut down and in-flight connections have finished.
     */
    void serve();

    // bindAndListen() followed by serve().
    void listen();

    void stop();

    int port() const { return boundPort; }

    // Decode, parse, route and serialize one buffer of request bytes.
    std::string handleRawRequest(const std::string& bytes) const;
};

/**
 * @brief Write the whole buffer, retrying on partial writes and EINTR
 * @return false on any other send error
 */
bool sendAll(int socket, const std::string& data);

// Pause before the next accept() after a failure; non-zero only when out of descriptors or memory.
std::chrono::milliseconds acceptRetryDelay(int acceptError);
