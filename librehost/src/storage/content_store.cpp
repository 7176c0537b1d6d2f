#include "../../include/content_store.hpp"
#include "../../include/content_digest.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace rehost {

Asset ContentStore::put(const EncodedImage& image) {
    Sha256 digest;
    try {
        digest = sha256(image.bytes);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Content digest failed: ") + e.what(), "content_store");
        throw RehostError(ErrorKind::StorageWriteFailed,
                          std::string("failed to compute the content key: ") + e.what());
    }

    Asset asset;
    asset.mime = image.mime;
    asset.width = image.width;
    asset.height = image.height;
    asset.byte_size = image.bytes.size();
    asset.content_digest = digest_string(digest);
    asset.storage_key = storage_key(digest, image.mime);

    bool exists = false;
    try {
        exists = store_->exists(asset.storage_key);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Existence check failed for " + asset.storage_key + ": " + e.what(),
                    "content_store");
        throw RehostError(ErrorKind::StorageUnavailable,
                          "failed to check existence of " + asset.storage_key + ": " + e.what());
    }

    if (exists) {
        asset.deduplicated = true;
        try {
            asset.public_url = store_->public_url_for(asset.storage_key);
        } catch (const std::exception& e) {
            throw RehostError(ErrorKind::StorageUnavailable,
                              "failed to build the URL of " + asset.storage_key + ": " + e.what());
        }
        Logger::log(LogLevel::Info, "Dedup hit: " + asset.storage_key, "content_store");
        return asset;
    }

    try {
        asset.public_url = store_->put(asset.storage_key, image.bytes, image.mime, config_.cache_control);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Upload failed for " + asset.storage_key + ": " + e.what(), "content_store");
        throw RehostError(ErrorKind::StorageWriteFailed,
                          "failed to upload " + asset.storage_key + ": " + e.what());
    }
    Logger::log(LogLevel::Info,
                "Uploaded " + asset.storage_key + " (" + image.mime + ", " + std::to_string(asset.byte_size) +
                " bytes)",
                "content_store");
    return asset;
}

} // namespace rehost
