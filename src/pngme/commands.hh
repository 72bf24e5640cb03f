//
// Commands of the pngme tool
//

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <pngme/parse_options.hh>

namespace pngme::cli {

    enum class command_kind {
        encode,
        decode,
        remove,
        print
    };

    struct command {
        command_kind kind;
        std::string file_path;
        std::string chunk_type;                 // encode, decode, remove
        std::string message;                    // encode
        std::optional<std::string> output_path; // encode, defaults to file_path
        bool lenient = false;
    };

    // Returns nullopt when the arguments do not form a valid command
    std::optional<command> parse_arguments(const std::vector<std::string>& args);

    void print_usage(const std::string& program);

    // Throws pngme_error on failure
    void run(const command& cmd);

    parse_options make_options(const command& cmd);
}
