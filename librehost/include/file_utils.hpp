#ifndef REHOST_FILE_UTILS_HPP
#define REHOST_FILE_UTILS_HPP

#include "types.hpp"
#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>

namespace rehost {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE* f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Reads a whole file into memory.
     * @param max_bytes Files larger than this are rejected.
     * @throws std::runtime_error if the file cannot be read or is too large.
     */
    Bytes read_file(const std::filesystem::path& path, std::size_t max_bytes);

    /**
     * @brief Writes @p data next to @p target under a random temporary name,
     * flushes it and renames it over @p target.
     *
     * Parent directories are created. The temporary file is removed if any
     * step fails.
     * @throws std::runtime_error on failure.
     */
    void write_file_atomic(const std::filesystem::path& target, std::span<const std::uint8_t> data);

} // namespace rehost

#endif // REHOST_FILE_UTILS_HPP
