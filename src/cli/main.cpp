#include "commands.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char const* const* argv) {
    auto args = std::vector<std::string>(argv + 1, argv + argc);
    return spatch::cli::run(args, std::cin, std::cout, std::cerr);
}
