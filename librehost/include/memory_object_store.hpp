#ifndef REHOST_MEMORY_OBJECT_STORE_HPP
#define REHOST_MEMORY_OBJECT_STORE_HPP

#include "object_store.hpp"
#include "types.hpp"
#include <map>
#include <mutex>
#include <optional>

namespace rehost {

    /**
     * @brief Thread-safe in-process object store.
     *
     * Keeps every object in memory and counts calls, which makes it the
     * store of choice for tests and dry runs. Failures can be injected.
     */
    class MemoryObjectStore final : public IObjectStore {
    public:
        struct Object {
            Bytes bytes;
            std::string content_type;
            std::string cache_control;
        };

        explicit MemoryObjectStore(std::string public_base_url)
            : public_base_url_(std::move(public_base_url)) {}

        [[nodiscard]] bool exists(const std::string& key) override;

        std::string put(const std::string& key,
                        std::span<const std::uint8_t> bytes,
                        const std::string& content_type,
                        const std::string& cache_control) override;

        [[nodiscard]] std::string public_url_for(const std::string& key) const override {
            return join_public_url(public_base_url_, key);
        }

        [[nodiscard]] std::optional<Object> get(const std::string& key) const;
        [[nodiscard]] std::size_t object_count() const;
        [[nodiscard]] std::size_t put_count() const;
        [[nodiscard]] std::size_t exists_count() const;

        void fail_exists(bool fail);
        void fail_put(bool fail);

    private:
        std::string public_base_url_;
        mutable std::mutex mtx_;
        std::map<std::string, Object> objects_;
        std::size_t puts_ = 0;
        std::size_t exists_calls_ = 0;
        bool fail_exists_ = false;
        bool fail_put_ = false;
    };

} // namespace rehost

#endif // REHOST_MEMORY_OBJECT_STORE_HPP
