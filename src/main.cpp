#include "cli.hpp"
#include "http.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    cronkit::http_init();
    int rc = cronkit::run_cli(args, std::cout, std::cerr);
    cronkit::http_cleanup();
    return rc;
}
