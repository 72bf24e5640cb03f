//
// Commands of the pngme tool
//

#include "commands.hh"

#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iomanip>

namespace pngme::cli {

    namespace {
        png load(const command& cmd) {
            std::ifstream file(cmd.file_path, std::ios::binary);
            THROW_IO_UNLESS(file, "Cannot open file '", cmd.file_path, "'");
            return png::read(file, make_options(cmd));
        }

        void save(const png& image, const std::string& path) {
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            THROW_IO_UNLESS(file, "Cannot create file '", path, "'");
            image.write(file);
        }

        std::vector<std::byte> to_bytes(const std::string& s) {
            std::vector<std::byte> out(s.size());
            std::transform(s.begin(), s.end(), out.begin(), [](char c) { return std::byte(c); });
            return out;
        }

        const char* yes_no(bool b) {
            return b ? "yes" : "no";
        }

        void encode(const command& cmd) {
            auto type = chunk_type::from_string(cmd.chunk_type);
            // A reserved bit chunk would make the written file unreadable
            if (!type.is_valid()) {
                THROW_ERROR(invalid_identifier_error, (type.bytes()),
                            "Cannot encode into chunk type ", type, ": reserved bit is set");
            }
            auto image = load(cmd);
            image.append_chunk(chunk(type, to_bytes(cmd.message)));

            const auto& out = cmd.output_path ? *cmd.output_path : cmd.file_path;
            save(image, out);
            std::cout << "Encoded " << cmd.message.size() << " bytes into chunk "
                      << type << " of " << out << "\n";
        }

        void decode(const command& cmd) {
            auto image = load(cmd);
            const auto& c = image.chunk_by_type(cmd.chunk_type);
            std::cout << c.data_as_string() << "\n";
        }

        void remove(const command& cmd) {
            auto image = load(cmd);
            auto removed = image.remove_first_chunk(cmd.chunk_type);
            save(image, cmd.file_path);

            std::cout << "Removed chunk " << removed.type() << " (" << removed.length() << " bytes)";
            std::string message;
            try {
                message = removed.data_as_string();
            } catch (const invalid_encoding_error&) {
                std::cout << " with binary data\n";
                return;
            }
            std::cout << " with message \"" << message << "\"\n";
        }

        void print(const command& cmd) {
            auto image = load(cmd);
            std::cout << cmd.file_path << ": " << image.chunks().size() << " chunks\n";
            std::cout << "=========================================\n";

            std::size_t index = 0;
            for (const auto& c : image.chunks()) {
                const auto& t = c.type();
                std::cout << std::setw(4) << index++ << "  " << t
                          << "  length " << std::setw(10) << c.length()
                          << "  crc 0x" << std::hex << std::setw(8) << std::setfill('0') << c.crc()
                          << std::dec << std::setfill(' ')
                          << "  critical: " << yes_no(t.is_critical())
                          << ", public: " << yes_no(t.is_public())
                          << ", safe to copy: " << yes_no(t.is_safe_to_copy())
                          << "\n";
            }
        }
    }

    std::optional<command> parse_arguments(const std::vector<std::string>& args) {
        std::vector<std::string> positional;
        bool lenient = false;
        for (const auto& arg : args) {
            if (arg == "--lenient") {
                lenient = true;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            return std::nullopt;
        }

        command cmd;
        cmd.lenient = lenient;
        const auto& name = positional[0];
        auto count = positional.size() - 1;

        if (name == "encode" && (count == 3 || count == 4)) {
            cmd.kind = command_kind::encode;
            cmd.file_path = positional[1];
            cmd.chunk_type = positional[2];
            cmd.message = positional[3];
            if (count == 4) {
                cmd.output_path = positional[4];
            }
        } else if (name == "decode" && count == 2) {
            cmd.kind = command_kind::decode;
            cmd.file_path = positional[1];
            cmd.chunk_type = positional[2];
        } else if (name == "remove" && count == 2) {
            cmd.kind = command_kind::remove;
            cmd.file_path = positional[1];
            cmd.chunk_type = positional[2];
        } else if (name == "print" && count == 1) {
            cmd.kind = command_kind::print;
            cmd.file_path = positional[1];
        } else {
            return std::nullopt;
        }
        return cmd;
    }

    void print_usage(const std::string& program) {
        std::cout << "Usage: " << program << " [--lenient] <command> <args>\n";
        std::cout << "\n";
        std::cout << "Hide messages in PNG files as ancillary chunks.\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <chunk_type> <message> [output]\n";
        std::cout << "    Append a chunk holding <message>, write to [output] or back to <file>\n";
        std::cout << "\n";
        std::cout << "  decode <file> <chunk_type>\n";
        std::cout << "    Print the message of the first chunk of <chunk_type>\n";
        std::cout << "\n";
        std::cout << "  remove <file> <chunk_type>\n";
        std::cout << "    Remove the first chunk of <chunk_type> and rewrite <file>\n";
        std::cout << "\n";
        std::cout << "  print <file>\n";
        std::cout << "    List every chunk in the file\n";
        std::cout << "\n";
        std::cout << "Chunk types are 4 ASCII letters; the third must be uppercase (e.g. ruSt).\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  --lenient   Warn instead of failing on oversized chunks\n";
    }

    parse_options make_options(const command& cmd) {
        parse_options options;
        options.strict = !cmd.lenient;
        options.on_warning = [](std::uint64_t offset,
                                std::string_view category,
                                std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };
        return options;
    }

    void run(const command& cmd) {
        switch (cmd.kind) {
            case command_kind::encode:
                encode(cmd);
                break;
            case command_kind::decode:
                decode(cmd);
                break;
            case command_kind::remove:
                remove(cmd);
                break;
            case command_kind::print:
                print(cmd);
                break;
        }
    }
}
