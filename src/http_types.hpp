#pragma once

#include <map>
#include <string>

typedef std::map<std::string, std::string> HeaderMap;

// Parsed request. Header keys keep the case they were sent with.
class Request {
private:
    std::string method_;
    std::string path_;
    HeaderMap headers_;
    std::string body_;

public:
    Request() {}
    Request(std::string method, std::string path, HeaderMap headers, std::string body);

    const std::string& method() const { return method_; }
    const std::string& path() const { return path_; }
    const HeaderMap& headers() const { return headers_; }
    const std::string& body() const { return body_; }

    // Exact, case-sensitive key lookup. Returns nullptr when absent.
    const std::string* header(const std::string& name) const;
};

struct Response {
    int statusCode = 200;
    std::string statusText = "OK";
    std::string contentType = "text/plain";
    std::string body;
};

std::string statusTextFor(int statusCode);

Response makeResponse(int statusCode, const std::string& body, const std::string& contentType = "text/plain");

/**
 * @brief Serialize a response for the wire
 *
 * Emits exactly the status line, Content-Type and Content-Length, a blank
 * line and the body. Content-Length is always body.size().
 */
std::string formatHTTPResponse(const Response& response);
