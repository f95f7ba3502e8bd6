#include <pngme/file_io.hh>
#include <pngme/exceptions.hh>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace pngme {

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        if (!std::filesystem::exists(status)) {
            THROW_IO("File not found: '", path.string(), "'");
        }
        THROW_IO_UNLESS(std::filesystem::is_regular_file(status), "Not a regular file: '", path.string(), "'");

        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "': ", std::strerror(errno));

        file.seekg(0, std::ios::end);
        auto size = file.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Cannot determine size of '", path.string(), "'");
        file.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(size));
        if (!data.empty()) {
            file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
            THROW_IO_IF(static_cast<std::size_t>(file.gcount()) != data.size(),
                        "Unexpected EOF reading '", path.string(), "': requested ", data.size(),
                        " bytes, got ", file.gcount());
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Cannot open '", path.string(), "' for writing: ", std::strerror(errno));

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        THROW_IO_UNLESS(file, "Error when writing to '", path.string(), "'");
    }

} // namespace pngme
