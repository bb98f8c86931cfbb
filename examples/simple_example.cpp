/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic pngme usage
 *
 * This is a minimal example showing how to load a PNG file
 * and print information about its chunks.
 */

#include <pngme/file_io.hh>
#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <string_view>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        pngme::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };

        auto image = pngme::png::parse(pngme::read_file(argv[1]), options);

        for (const auto& chunk : image.chunks()) {
            std::cout << "Chunk: " << chunk.tag().to_string()
                      << " (" << chunk.length() << " bytes)";
            if (!chunk.tag().is_critical()) {
                std::cout << " ancillary";
            }
            if (!chunk.tag().is_public()) {
                std::cout << " private";
            }
            if (chunk.tag().is_safe_to_copy()) {
                std::cout << " safe-to-copy";
            }
            std::cout << "\n";
        }

        std::cout << "\nParsing completed successfully!\n";

    } catch (const pngme::parse_error& e) {
        std::cerr << "Error [" << pngme::to_string(e.code()) << "] at offset "
                  << e.offset() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
