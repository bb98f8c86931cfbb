/**
 * @file commands.hh
 * @brief The four file-level operations behind the pngme tool
 *
 * Every command loads the whole file, parses it and works on the in-memory
 * chunk list. Console output goes to the stream passed in, so the commands
 * can be driven from tests as well as from main().
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <pngme/export_pngme.h>
#include <pngme/parse_options.hh>

namespace pngme {

    struct encode_args {
        std::filesystem::path file_path;
        std::string chunk_type;
        std::string message;
        std::optional<std::filesystem::path> output_file;
    };

    struct decode_args {
        std::filesystem::path file_path;
        std::string chunk_type;
    };

    struct remove_args {
        std::filesystem::path file_path;
        std::string chunk_type;
    };

    struct print_args {
        std::filesystem::path file_path;
    };

    /**
     * @brief Append a chunk carrying the message
     *
     * The result is written to output_file when one is given; otherwise the
     * modified stream is discarded.
     */
    PNGME_EXPORT void run_encode(const encode_args& args, std::ostream& out, const parse_options& options = {});

    /**
     * @brief Print the payload of the first chunk of the given type
     *
     * A missing chunk is reported on out, not as an error.
     */
    PNGME_EXPORT void run_decode(const decode_args& args, std::ostream& out, const parse_options& options = {});

    /**
     * @brief Remove the first chunk of the given type and print its payload
     *
     * The file on disk is left unchanged.
     *
     * @throws lookup_error if there is no such chunk
     */
    PNGME_EXPORT void run_remove(const remove_args& args, std::ostream& out, const parse_options& options = {});

    /**
     * @brief Print a listing of every chunk in the file
     */
    PNGME_EXPORT void run_print(const print_args& args, std::ostream& out, const parse_options& options = {});

} // namespace pngme
