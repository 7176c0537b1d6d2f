#include "../../include/filesystem_object_store.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <system_error>

namespace rehost {

FilesystemObjectStore::FilesystemObjectStore(std::filesystem::path root, std::string public_base_url)
    : root_(std::move(root)), public_base_url_(std::move(public_base_url)) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create store root " + root_.string() + ": " + ec.message());
    }
}

std::filesystem::path FilesystemObjectStore::path_for(const std::string& key) const {
    const std::filesystem::path rel(key);
    if (key.empty() || rel.is_absolute() || key.find("..") != std::string::npos) {
        throw std::runtime_error("invalid object key: " + key);
    }
    return root_ / rel;
}

bool FilesystemObjectStore::exists(const std::string& key) {
    std::error_code ec;
    const bool found = std::filesystem::is_regular_file(path_for(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw std::runtime_error("stat failed for " + key + ": " + ec.message());
    }
    return found;
}

std::string FilesystemObjectStore::put(const std::string& key,
                                       const std::span<const std::uint8_t> bytes,
                                       const std::string& content_type,
                                       const std::string&) {
    const auto target = path_for(key);
    write_file_atomic(target, bytes);
    Logger::log(LogLevel::Debug,
                "Stored " + key + " (" + content_type + ", " + std::to_string(bytes.size()) + " bytes) at " +
                target.string(),
                "fs_store");
    return public_url_for(key);
}

} // namespace rehost
