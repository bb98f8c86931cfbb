/**
 * @file file_io.hh
 * @brief Whole-file load and store
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @brief Read an entire file into memory
     * @throws io_error if the file cannot be opened or read
     */
    PNGME_EXPORT std::vector<std::byte> read_file(const std::filesystem::path& path);

    /**
     * @brief Replace the contents of a file with the given bytes
     *
     * The file is truncated and written with a single write call.
     *
     * @throws io_error if the file cannot be opened or written
     */
    PNGME_EXPORT void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes);

} // namespace pngme
