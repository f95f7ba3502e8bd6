/**
 * @file cli.hh
 * @brief Command dispatch for the pngme tool
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace pngme::cli {
    /**
     * @brief Run one pngme command line
     *
     * Options are accepted only before the command word; "--" ends them
     * explicitly. Everything after the command word is positional.
     *
     * @param args Full argument list, args[0] being the program name
     * @param out Receives command output and the usage text for --help
     * @param err Receives errors, warnings and usage after a usage error
     * @return Process exit status: 0 on success, 1 on any error
     */
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
}
