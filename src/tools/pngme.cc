//
// pngme command-line tool: hide and recover messages in PNG chunks
//

#include <pngme/commands.hh>
#include <pngme/exceptions.hh>
#include <pngme/pngme_config.h>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [arguments]\n"
              << "\n"
              << "Commands:\n"
              << "  encode <file> <chunk-type> <message> [output-file]\n"
              << "  decode <file> <chunk-type>\n"
              << "  remove <file> <chunk-type>\n"
              << "  print  <file>\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help     Show this message\n"
              << "  -v, --version  Show version\n";
}

static pngme::parse_options make_options() {
    pngme::parse_options options;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning at offset " << offset
                  << " [" << category << "]: " << message << "\n";
    };
    return options;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }

    const std::string_view command = argv[1];
    const int nargs = argc - 2;
    char** args = argv + 2;

    if (command == "-h" || command == "--help") {
        usage(argv[0]);
        return 0;
    }
    if (command == "-v" || command == "--version") {
        std::cout << "pngme " << PNGME_VERSION_STRING << "\n";
        return 0;
    }

    auto options = make_options();

    try {
        if (command == "encode" && (nargs == 3 || nargs == 4)) {
            pngme::encode_args a{args[0], args[1], args[2], std::nullopt};
            if (nargs == 4) {
                a.output_file = args[3];
            }
            pngme::run_encode(a, std::cout, options);
        } else if (command == "decode" && nargs == 2) {
            pngme::run_decode({args[0], args[1]}, std::cout, options);
        } else if (command == "remove" && nargs == 2) {
            pngme::run_remove({args[0], args[1]}, std::cout, options);
        } else if (command == "print" && nargs == 1) {
            pngme::run_print({args[0]}, std::cout, options);
        } else {
            std::cerr << "Error: invalid command or wrong number of arguments: " << command << "\n\n";
            usage(argv[0]);
            return 2;
        }
    } catch (const pngme::png_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
