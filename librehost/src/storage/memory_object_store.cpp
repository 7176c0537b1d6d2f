#include "../../include/memory_object_store.hpp"
#include <stdexcept>

namespace rehost {

bool MemoryObjectStore::exists(const std::string& key) {
    std::lock_guard lock(mtx_);
    ++exists_calls_;
    if (fail_exists_) throw std::runtime_error("memory store: injected HEAD failure");
    return objects_.contains(key);
}

std::string MemoryObjectStore::put(const std::string& key,
                                   const std::span<const std::uint8_t> bytes,
                                   const std::string& content_type,
                                   const std::string& cache_control) {
    {
        std::lock_guard lock(mtx_);
        if (fail_put_) throw std::runtime_error("memory store: injected PUT failure");
        ++puts_;
        objects_[key] = Object{Bytes(bytes.begin(), bytes.end()), content_type, cache_control};
    }
    return public_url_for(key);
}

std::optional<MemoryObjectStore::Object> MemoryObjectStore::get(const std::string& key) const {
    std::lock_guard lock(mtx_);
    const auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

std::size_t MemoryObjectStore::object_count() const {
    std::lock_guard lock(mtx_);
    return objects_.size();
}

std::size_t MemoryObjectStore::put_count() const {
    std::lock_guard lock(mtx_);
    return puts_;
}

std::size_t MemoryObjectStore::exists_count() const {
    std::lock_guard lock(mtx_);
    return exists_calls_;
}

void MemoryObjectStore::fail_exists(const bool fail) {
    std::lock_guard lock(mtx_);
    fail_exists_ = fail;
}

void MemoryObjectStore::fail_put(const bool fail) {
    std::lock_guard lock(mtx_);
    fail_put_ = fail;
}

} // namespace rehost
