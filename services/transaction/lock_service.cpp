#include "lock_service.hpp"

namespace services::transaction {

    lock_service_t::lock_service_t(std::pmr::memory_resource* resource)
        : collections_(resource) {}

    std::unique_lock<std::mutex> lock_service_t::lock_header() { return std::unique_lock(header_mutex_); }

    std::unique_lock<std::mutex> lock_service_t::lock_collection(std::string_view name) {
        return std::unique_lock(collection_mutex_(name));
    }

    std::mutex& lock_service_t::collection_mutex_(std::string_view name) {
        std::lock_guard guard(collections_mutex_);
        auto it = collections_.find(name);
        if (it == collections_.end()) {
            it = collections_.emplace(std::string(name), std::make_unique<std::mutex>()).first;
        }
        return *it->second;
    }

} // namespace services::transaction
