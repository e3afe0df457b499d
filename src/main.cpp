#include <exception>
#include <iostream>

#include "config.hpp"
#include "logger.hpp"
#include "router.hpp"
#include "server.hpp"

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cout << "Usage: " << argv[0] << " [settings.json]" << std::endl;
        return 1;
    }

    StreamLogSink log(std::cerr);

    try {
        ServerSettings settings;
        if (argc == 2) {
            log.info("MAIN", std::string("Loading settings from ") + argv[1]);
            settings = loadSettings(argv[1]);
        }

        Router router(settings, log);
        HTTPServer server(settings, router, log);

        log.info("MAIN", "Starting listener on " + settings.host + ":" + std::to_string(settings.port));
        server.listen();

        return 0;

    } catch (const std::exception& e) {
        log.error("MAIN", e.what());
        return 1;
    }
}
