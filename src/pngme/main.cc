//
// pngme command line tool
//

#include <iostream>
#include <string>
#include <vector>

#include <pngme/exceptions.hh>
#include "commands.hh"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto cmd = pngme::cli::parse_arguments(args);
    if (!cmd) {
        pngme::cli::print_usage(argv[0]);
        return 1;
    }

    try {
        pngme::cli::run(*cmd);
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
