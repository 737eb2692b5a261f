#include "cli.hpp"
#include "http.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) try {
    std::vector<std::string> args(argv + 1, argv + argc);

    epss::http_init();
    epss::PlatformHttpClient http_client;
    int rc = epss::run_cli(args, http_client, std::cout, std::cerr);
    epss::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
