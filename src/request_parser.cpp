#include "request_parser.hpp"
#include "text_utils.hpp"
#include <sstream>
#include <vector>

Request parseHTTPRequest(const std::string& raw) {
    std::vector<std::string> lines = splitLines(raw);

    std::string method;
    std::string path;
    HeaderMap headers;
    std::string body;

    if (lines.empty()) {
        return Request();
    }

    std::istringstream request_line(lines[0]);
    request_line >> method >> path;

    size_t i = 1;
    for (; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) {
            break;
        }

        size_t sep = line.find(": ");
        if (sep != std::string::npos) {
            headers[line.substr(0, sep)] = line.substr(sep + 2);
        }
    }

    if (i < lines.size()) {
        for (size_t j = i + 1; j < lines.size(); ++j) {
            if (j > i + 1) {
                body += '\n';
            }
            body += lines[j];
        }
    }

    return Request(method, path, headers, body);
}
