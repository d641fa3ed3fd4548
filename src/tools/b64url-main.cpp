#include "cli.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    return b64url::cli::execute(argc, argv, std::cin, std::cout, std::cerr);
}
