#ifndef REHOST_FILESYSTEM_OBJECT_STORE_HPP
#define REHOST_FILESYSTEM_OBJECT_STORE_HPP

#include "object_store.hpp"
#include <filesystem>

namespace rehost {

    /**
     * @brief Object store backed by a local directory tree.
     *
     * Keys map to relative paths under the root (the shard prefix becomes a
     * subdirectory). Writes go to a uniquely named temporary file in the
     * target directory and are renamed into place, so concurrent writers of
     * the same key leave exactly one complete object. Content type and cache
     * control are not persisted.
     */
    class FilesystemObjectStore final : public IObjectStore {
    public:
        FilesystemObjectStore(std::filesystem::path root, std::string public_base_url);

        [[nodiscard]] bool exists(const std::string& key) override;

        std::string put(const std::string& key,
                        std::span<const std::uint8_t> bytes,
                        const std::string& content_type,
                        const std::string& cache_control) override;

        [[nodiscard]] std::string public_url_for(const std::string& key) const override {
            return join_public_url(public_base_url_, key);
        }

        [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    private:
        [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;

        std::filesystem::path root_;
        std::string public_base_url_;
    };

} // namespace rehost

#endif // REHOST_FILESYSTEM_OBJECT_STORE_HPP
