#include "app.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <cstdlib>

// Interrupt leaves immediately, bypassing the normal exit path
static void signal_handler(int /*sig*/) {
    std::_Exit(0);
}

int main(int argc, char* argv[]) try {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) args.emplace_back(argv[i]);

    auto config = troupe::Config::load();
    troupe::http_init();

    troupe::CurlHttpClient http_client;
    int rc = troupe::run(args, config, http_client, std::cin, std::cout);

    troupe::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
