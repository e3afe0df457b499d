#include "http_types.hpp"
#include <sstream>
#include <utility>

Request::Request(std::string method, std::string path, HeaderMap headers, std::string body)
    : method_(std::move(method)),
      path_(std::move(path)),
      headers_(std::move(headers)),
      body_(std::move(body)) {}

const std::string* Request::header(const std::string& name) const {
    auto it = headers_.find(name);
    if (it == headers_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string statusTextFor(int statusCode) {
    switch (statusCode) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 415: return "Unsupported Media Type";
    case 500: return "Internal Server Error";
    default: return "Unknown";
    }
}

Response makeResponse(int statusCode, const std::string& body, const std::string& contentType) {
    Response response;
    response.statusCode = statusCode;
    response.statusText = statusTextFor(statusCode);
    response.contentType = contentType;
    response.body = body;
    return response;
}

std::string formatHTTPResponse(const Response& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.statusCode << " " << response.statusText << "\r\n";
    out << "Content-Type: " << response.contentType << "\r\n";
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "\r\n";
    out << response.body;
    return out.str();
}
