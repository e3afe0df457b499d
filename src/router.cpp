#include "router.hpp"
#include "post_handler.hpp"
#include "text_utils.hpp"

namespace {

const char* const WELCOME_MESSAGE = "Welcome to the homepage!";

}

Router::Router(const ServerSettings& settings, LogSink& sink)
    : staticMount{settings.staticPrefix, settings.documentRoot},
      submitPath(settings.submitPath),
      log(sink) {}

Response Router::route(const Request& req) const {
    log.info("ROUTER", req.method() + " " + req.path());

    if (req.method() == "GET") {
        if (req.path() == "/") {
            return makeResponse(200, WELCOME_MESSAGE);
        }
        if (startsWith(req.path(), staticMount.prefix)) {
            return serveStaticFile(req.path(), staticMount, log);
        }
        return makeResponse(404, "404 Not Found");
    }

    if (req.method() == "POST") {
        return handlePost(req, submitPath, log);
    }

    return makeResponse(405, "405 Method Not Allowed");
}
