//
// Whole-file load and store
//

#include <pngme/file_io.hh>
#include <pngme/exceptions.hh>
#include <fstream>

namespace pngme {

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_IF(!file, "Cannot open file '", path.string(), "' for reading");

        file.seekg(0, std::ios::end);
        auto size = file.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Failed to get size of '", path.string(), "'");
        file.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(size));
        if (!data.empty()) {
            file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
            THROW_IO_IF(file.gcount() != static_cast<std::streamsize>(data.size()),
                        "Unexpected EOF reading '", path.string(), "': requested ", data.size(),
                        " got ", file.gcount());
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_IF(!file, "Cannot open file '", path.string(), "' for writing");

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        THROW_IO_IF(!file, "Failed to write ", bytes.size(), " bytes to '", path.string(), "'");
    }

}
