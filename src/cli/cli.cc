#include "cli.hh"

#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/file_io.hh>
#include <pngme/parse_options.hh>
#include <pngme/png.hh>
#include <pngme/pngme_config.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <ostream>
#include <string_view>

namespace pngme::cli {
    namespace {
        void print_usage(std::ostream& os, std::string_view prog) {
            os << "Usage: " << prog << " [--lenient] [--] <command> [args]\n";
            os << "\n";
            os << "Hide text messages inside PNG files as custom chunks.\n";
            os << "\n";
            os << "Commands:\n";
            os << "  encode <file> <chunk-type> <message> [output-file]\n";
            os << "    Append a chunk carrying <message> and write the result\n";
            os << "    to <output-file> (default: overwrite <file>)\n";
            os << "\n";
            os << "  decode <file> <chunk-type>\n";
            os << "    Print the message stored in the first chunk of that type\n";
            os << "\n";
            os << "  remove <file> <chunk-type>\n";
            os << "    Remove the first chunk of that type\n";
            os << "\n";
            os << "  print <file>\n";
            os << "    List every chunk in the file\n";
            os << "\n";
            os << "Options (before the command):\n";
            os << "  --lenient   Accept chunk types with a lowercase third letter\n";
            os << "  --help      Print this text and exit\n";
            os << "  --version   Print version and exit\n";
            os << "  --          End of options\n";
            os << "\n";
            os << "Example:\n";
            os << "  " << prog << " encode image.png ruSt \"This is where your secret message will be!\"\n";
        }

        struct context {
            std::vector<std::string> args;
            parse_options options;
            std::ostream& out;
        };

        png load(const std::filesystem::path& path, const parse_options& options) {
            auto bytes = read_file(path);
            return png::parse(bytes, options);
        }

        int cmd_encode(const context& ctx) {
            std::filesystem::path input(ctx.args[0]);
            std::filesystem::path output = ctx.args.size() > 3 ? std::filesystem::path(ctx.args[3]) : input;

            auto image = load(input, ctx.options);
            image.append_chunk(chunk(chunk_type::from_string(ctx.args[1]), std::string_view(ctx.args[2])));

            // Serialize fully before touching the output file
            auto bytes = image.to_bytes();
            write_file(output, bytes);
            return 0;
        }

        int cmd_decode(const context& ctx) {
            auto image = load(ctx.args[0], ctx.options);
            if (const auto* secret = image.chunk_by_type(ctx.args[1])) {
                ctx.out << secret->data_as_string() << "\n";
            } else {
                ctx.out << "No secret found :(\n";
            }
            return 0;
        }

        int cmd_remove(const context& ctx) {
            std::filesystem::path path(ctx.args[0]);
            auto image = load(path, ctx.options);
            auto removed = image.remove_chunk(ctx.args[1]);

            auto bytes = image.to_bytes();
            write_file(path, bytes);
            ctx.out << "Removed " << removed << "\n";
            return 0;
        }

        int cmd_print(const context& ctx) {
            ctx.out << load(ctx.args[0], ctx.options);
            return 0;
        }

        struct command {
            std::string_view name;
            std::size_t min_args;
            std::size_t max_args;
            int (*run)(const context&);
        };

        constexpr command commands[] = {
            {.name = "encode", .min_args = 3, .max_args = 4, .run = cmd_encode},
            {.name = "decode", .min_args = 2, .max_args = 2, .run = cmd_decode},
            {.name = "remove", .min_args = 2, .max_args = 2, .run = cmd_remove},
            {.name = "print",  .min_args = 1, .max_args = 1, .run = cmd_print},
        };
    }

    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
        std::string_view prog = args.empty() ? "pngme" : std::string_view(args.front());

        parse_options options;
        options.on_warning = [&err](std::uint64_t offset, std::string_view category, std::string_view message) {
            err << "warning: [" << category << "] at offset " << offset << ": " << message << "\n";
        };

        std::size_t pos = 1;
        for (; pos < args.size(); ++pos) {
            const std::string& arg = args[pos];
            if (arg == "--") {
                ++pos;
                break;
            }
            if (arg.empty() || arg[0] != '-') {
                break;
            }
            if (arg == "--lenient") {
                options.strict = false;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(out, prog);
                return 0;
            } else if (arg == "--version") {
                out << "pngme " << LIBPNGME_VERSION_STRING << "\n";
                return 0;
            } else {
                err << "Error: unknown option '" << arg << "'\n\n";
                print_usage(err, prog);
                return 1;
            }
        }

        if (pos >= args.size()) {
            print_usage(err, prog);
            return 1;
        }

        const std::string& name = args[pos];
        for (const auto& cmd : commands) {
            if (cmd.name != name) {
                continue;
            }
            context ctx{
                .args = std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(pos) + 1, args.end()),
                .options = options,
                .out = out
            };
            if (ctx.args.size() < cmd.min_args || ctx.args.size() > cmd.max_args) {
                err << "Error: wrong number of arguments for '" << cmd.name << "'\n\n";
                print_usage(err, prog);
                return 1;
            }

            try {
                return cmd.run(ctx);
            } catch (const std::exception& e) {
                err << "Error: " << e.what() << "\n";
                return 1;
            }
        }

        err << "Error: unknown command '" << name << "'\n\n";
        print_usage(err, prog);
        return 1;
    }
}
