/**
 * @file file_io.hh
 * @brief Whole-file read and write helpers
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @brief Read a whole file into memory
     * @throws io_error naming @p path if the file is missing, is not a
     *         regular file, or cannot be read completely
     */
    PNGME_EXPORT std::vector<std::byte> read_file(const std::filesystem::path& path);

    /**
     * @brief Replace the contents of @p path with @p bytes
     * @throws io_error naming @p path if the file cannot be opened or written
     */
    PNGME_EXPORT void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes);

} // namespace pngme
