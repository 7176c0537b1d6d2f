#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <stdexcept>
#include <system_error>

namespace rehost {

Bytes read_file(const std::filesystem::path& path, const std::size_t max_bytes) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat " + path.string() + ": " + ec.message());
    }
    if (size > max_bytes) {
        throw std::runtime_error(path.string() + " exceeds " + std::to_string(max_bytes) + " bytes");
    }

    const unique_FILE in(std::fopen(path.string().c_str(), "rb"));
    if (!in) {
        throw std::runtime_error("Cannot open " + path.string());
    }

    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty() && std::fread(data.data(), 1, data.size(), in.get()) != data.size()) {
        throw std::runtime_error("Short read on " + path.string());
    }
    return data;
}

void write_file_atomic(const std::filesystem::path& target, const std::span<const std::uint8_t> data) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    const auto tmp = target.parent_path() /
                     ("." + target.filename().string() + ".tmp-" + RandomUtils::random_suffix());
    {
        const unique_FILE out(std::fopen(tmp.string().c_str(), "wb"));
        if (!out) {
            throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
        }
        const bool written = data.empty() ||
                             std::fwrite(data.data(), 1, data.size(), out.get()) == data.size();
        if (!written || std::fflush(out.get()) != 0) {
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("Write failed for " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::error_code rm_ec;
        std::filesystem::remove(tmp, rm_ec);
        if (rm_ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp file: " + tmp.string(), "file_utils");
        }
        throw std::runtime_error("Rename to " + target.string() + " failed: " + reason);
    }
}

} // namespace rehost
