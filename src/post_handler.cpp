#include "post_handler.hpp"

Response handlePost(const Request& req, const std::string& submitPath, LogSink& log) {
    if (req.path() != submitPath) {
        return makeResponse(404, "404 Not Found");
    }

    log.info("POST", "Processing " + submitPath + " with body: " + req.body());

    // Header names are matched exactly as sent; "content-type" does not count.
    const std::string* content_type = req.header("Content-Type");
    if (content_type != nullptr) {
        if (*content_type == "application/json") {
            log.info("POST", "Received JSON payload");
            return makeResponse(200, "Received JSON: " + req.body());
        }
        if (*content_type == "application/x-www-form-urlencoded") {
            log.info("POST", "Received form-encoded payload");
            return makeResponse(200, "Received form data: " + req.body());
        }
    }

    log.warn("POST", "Unsupported Content-Type: " + (content_type != nullptr ? *content_type : std::string("<none>")));
    return makeResponse(415, "Unsupported Content-Type");
}
