#include "cli/cli.hpp"
#include "config/client_config.hpp"

#include <unistd.h>

#include <cstdlib>
#include <exception>
#include <iostream>

// ---------------------------------------------------------------------------
// main
//   srcon [flags] [command words...]
//   종료 코드: 0 성공, 1 오류, 130 SIGINT
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    try {
        return run_cli(argc, argv, std::cin, std::cout, std::cerr,
                       process_env(), ::isatty(STDIN_FILENO) != 0);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
