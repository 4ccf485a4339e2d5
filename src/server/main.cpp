#include <iostream>
#include <csignal>
#include <cstdlib>

#include "frontend_server.h"
#include "config/config_error.h"
#include "config/server_config.h"
#include "common/debug.h"

namespace {
server::FrontendServer* g_server = nullptr;

void onSignal(int) {
    if (g_server) g_server->stop();
}
}

int main(int argc, char** argv) {
    config::ServerConfig cfg;
    if (argc > 1) {
        try {
            cfg = config::loadServerConfig(argv[1]);
        } catch (const config::ConfigError& e) {
            error_cpp20(e.what());
            return EXIT_FAILURE;
        }
    }

    server::FrontendServer server(cfg);
    if (!server.start()) {
        return EXIT_FAILURE;
    }
    g_server = &server;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::cout << cfg.frontendId << " listening on " << cfg.host << ":" << server.port() << std::endl;
    server.run();
    g_server = nullptr;

    return EXIT_SUCCESS;
}
