/**
 * @file content_store.hpp
 * @brief Content-addressed, deduplicating put on top of an IObjectStore.
 */

#ifndef REHOST_CONTENT_STORE_HPP
#define REHOST_CONTENT_STORE_HPP

#include "config.hpp"
#include "object_store.hpp"
#include "types.hpp"
#include <memory>

namespace rehost {

    /**
     * @brief Stores final image bytes at most once per distinct content.
     *
     * put() hashes the bytes, derives the storage key, asks the object
     * store whether the key exists and uploads only when it does not. There
     * is no locking: two concurrent puts of identical bytes may both upload,
     * which the store's same-key overwrite makes harmless.
     */
    class ContentStore {
    public:
        ContentStore(std::shared_ptr<IObjectStore> store, StoreConfig config)
            : store_(std::move(store)), config_(std::move(config)) {}

        /**
         * @throws RehostError(StorageUnavailable) if the existence check fails.
         * @throws RehostError(StorageWriteFailed) if the upload fails.
         */
        [[nodiscard]] Asset put(const EncodedImage& image);

        [[nodiscard]] IObjectStore& object_store() const noexcept { return *store_; }

    private:
        std::shared_ptr<IObjectStore> store_;
        StoreConfig config_;
    };

} // namespace rehost

#endif // REHOST_CONTENT_STORE_HPP
