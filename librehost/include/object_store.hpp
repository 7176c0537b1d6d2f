/**
 * @file object_store.hpp
 * @brief Boundary to the append-only object store holding rehosted assets.
 */

#ifndef REHOST_OBJECT_STORE_HPP
#define REHOST_OBJECT_STORE_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rehost {

    /**
     * @brief Key/value object store addressed by storage key.
     *
     * Implementations must make a put of an existing key an idempotent
     * overwrite. Failures are reported as exceptions; the ContentStore maps
     * them to StorageUnavailable / StorageWriteFailed.
     */
    class IObjectStore {
    public:
        virtual ~IObjectStore() = default;

        /**
         * @return true if an object exists at @p key; false for "not found".
         * @throws std::runtime_error for any other failure.
         */
        [[nodiscard]] virtual bool exists(const std::string& key) = 0;

        /**
         * @brief Store @p bytes at @p key.
         * @return The public URL of the object.
         * @throws std::runtime_error on failure.
         */
        virtual std::string put(const std::string& key,
                                std::span<const std::uint8_t> bytes,
                                const std::string& content_type,
                                const std::string& cache_control) = 0;

        /**
         * @brief Public URL for a key, whether or not it exists.
         */
        [[nodiscard]] virtual std::string public_url_for(const std::string& key) const = 0;
    };

    /**
     * @brief base_url (trailing slashes trimmed) + "/" + key.
     */
    [[nodiscard]] inline std::string join_public_url(std::string_view base_url, const std::string_view key) {
        while (!base_url.empty() && base_url.back() == '/') base_url.remove_suffix(1);
        std::string out(base_url);
        out.push_back('/');
        out.append(key);
        return out;
    }

} // namespace rehost

#endif // REHOST_OBJECT_STORE_HPP
