#include "server.hpp"
#include "request_parser.hpp"
#include "text_utils.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

std::string describePeer(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) {
        return "unknown";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

}

std::chrono::milliseconds acceptRetryDelay(int acceptError) {
    switch (acceptError) {
    case EMFILE:
    case ENFILE:
    case ENOBUFS:
    case ENOMEM:
        return std::chrono::milliseconds(Config::ACCEPT_RETRY_DELAY_MS);
    default:
        return std::chrono::milliseconds(0);
    }
}

bool sendAll(int socket, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

HTTPServer::HTTPServer(const ServerSettings& settings, const Router& router, LogSink& log)
    : settings(settings),
      router(router),
      log(log),
      listenSocket(-1),
      boundPort(0),
      stopping(false),
      activeConnections(0) {}

HTTPServer::~HTTPServer() {
    if (listenSocket >= 0) {
        close(listenSocket);
    }
}

int HTTPServer::bindAndListen() {
    if (settings.readBufferSize == 0 || settings.readBufferSize > Config::MAX_READ_BUFFER_SIZE) {
        throw std::runtime_error("Read buffer size out of range: " + std::to_string(settings.readBufferSize));
    }

    sockaddr_in server_addr;
    std::memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(settings.port));
    if (inet_pton(AF_INET, settings.host.c_str(), &server_addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + settings.host);
    }

    int server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket < 0) {
        throw std::runtime_error(errnoMessage("Error creating socket"));
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::string message = errnoMessage("Error setting socket options");
        close(server_socket);
        throw std::runtime_error(message);
    }

    if (bind(server_socket, (struct sockaddr *)&server_addr, sizeof(server_addr)) < 0) {
        std::string message = errnoMessage("Error binding " + settings.host + ":" + std::to_string(settings.port));
        close(server_socket);
        throw std::runtime_error(message);
    }

    if (::listen(server_socket, Config::LISTEN_BACKLOG) < 0) {
        std::string message = errnoMessage("Error listening");
        close(server_socket);
        throw std::runtime_error(message);
    }

    sockaddr_in bound_addr;
    socklen_t bound_len = sizeof(bound_addr);
    if (getsockname(server_socket, (struct sockaddr *)&bound_addr, &bound_len) < 0) {
        std::string message = errnoMessage("Error reading bound address");
        close(server_socket);
        throw std::runtime_error(message);
    }

    listenSocket = server_socket;
    boundPort = ntohs(bound_addr.sin_port);
    stopping = false;
    return boundPort;
}

void HTTPServer::serve() {
    if (listenSocket < 0) {
        throw std::runtime_error("serve() called before bindAndListen()");
    }

    while (!stopping) {
        sockaddr_in client_addr;
        socklen_t client_addr_len = sizeof(client_addr);

        int client_socket = accept(listenSocket, (struct sockaddr *)&client_addr, &client_addr_len);
        if (client_socket < 0) {
            if (stopping) {
                break;
            }
            int accept_error = errno;
            if (accept_error != EINTR) {
                log.error("SERVER", errnoMessage("Error accepting connection"));
            }
            std::chrono::milliseconds delay = acceptRetryDelay(accept_error);
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            continue;
        }

        std::string peer = describePeer(client_addr);
        log.info("SERVER", "New connection from " + peer);
        applyTimeouts(client_socket);

        {
            std::lock_guard<std::mutex> lock(connectionsMutex);
            ++activeConnections;
        }

        try {
            std::thread(&HTTPServer::handleConnection, this, client_socket, peer).detach();
        } catch (const std::system_error& e) {
            log.error("SERVER", std::string("Cannot start connection thread: ") + e.what());
            close(client_socket);
            connectionFinished();
        }
    }

    std::unique_lock<std::mutex> lock(connectionsMutex);
    connectionsDone.wait(lock, [this] { return activeConnections == 0; });
    log.info("SERVER", "Stopped");
}

void HTTPServer::listen() {
    int port = bindAndListen();

    log.info("SERVER", "========================================");
    log.info("SERVER", "tinyhttp v" + std::string(Config::VERSION) + " listening on http://" + settings.host + ":" + std::to_string(port));
    log.info("SERVER", "Static files: " + settings.staticPrefix + " -> " + settings.documentRoot);
    log.info("SERVER", "Read buffer: " + std::to_string(settings.readBufferSize) + " bytes");
    log.info("SERVER", "========================================");

    serve();
}

void HTTPServer::stop() {
    stopping = true;
    if (listenSocket >= 0) {
        // Wakes a blocked accept() with an error.
        shutdown(listenSocket, SHUT_RDWR);
    }
}

void HTTPServer::applyTimeouts(int clientSocket) {
    if (settings.ioTimeoutSeconds <= 0) {
        return;
    }

    struct timeval tv;
    tv.tv_sec = settings.ioTimeoutSeconds;
    tv.tv_usec = 0;
    if (setsockopt(clientSocket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(clientSocket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        log.warn("SERVER", errnoMessage("Cannot set socket timeouts"));
    }
}

void HTTPServer::connectionFinished() {
    std::lock_guard<std::mutex> lock(connectionsMutex);
    --activeConnections;
    if (activeConnections == 0) {
        connectionsDone.notify_all();
    }
}

std::string HTTPServer::handleRawRequest(const std::string& bytes) const {
    Request req = parseHTTPRequest(decodeUtf8Lossy(bytes));
    return formatHTTPResponse(router.route(req));
}

void HTTPServer::handleConnection(int clientSocket, const std::string& peer) {
    // Anything thrown here would terminate the process from a detached thread.
    try {
        std::vector<char> buffer(settings.readBufferSize);
        ssize_t bytes_received = recv(clientSocket, buffer.data(), buffer.size(), 0);

        if (bytes_received == 0) {
            log.warn("SERVER", "Connection closed by client " + peer);
        } else if (bytes_received < 0) {
            log.error("SERVER", errnoMessage("Failed to read request from " + peer));
        } else {
            std::string response = handleRawRequest(std::string(buffer.data(), static_cast<size_t>(bytes_received)));
            if (sendAll(clientSocket, response)) {
                log.info("SERVER", "Response sent to " + peer);
            } else {
                log.error("SERVER", errnoMessage("Failed to send response to " + peer));
            }
        }
    } catch (const std::exception& e) {
        log.error("SERVER", "Dropped connection from " + peer + ": " + e.what());
    }

    close(clientSocket);
    connectionFinished();
}
