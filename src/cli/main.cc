/**
 * @file main.cc
 * @brief pngme - hide, reveal and remove text messages in PNG chunks
 */

#include <iostream>
#include <string>
#include <vector>

#include "cli.hh"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    return pngme::cli::run(args, std::cout, std::cerr);
}
