#pragma once

#include <core/string_utils.hpp>

#include <map>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <string>
#include <string_view>

namespace services::transaction {

    /// Exclusive locks shared by all transactions of one engine: a single header lock
    /// serializing changes of the collection directory, and one write lock per collection name.
    /// Acquisition blocks without timeout.
    class lock_service_t {
    public:
        explicit lock_service_t(std::pmr::memory_resource* resource);
        lock_service_t(const lock_service_t&) = delete;
        lock_service_t& operator=(const lock_service_t&) = delete;

        std::unique_lock<std::mutex> lock_header();
        std::unique_lock<std::mutex> lock_collection(std::string_view name);

    private:
        std::mutex& collection_mutex_(std::string_view name);

        std::mutex header_mutex_;
        std::mutex collections_mutex_;
        std::pmr::map<std::string, std::unique_ptr<std::mutex>, core::iless> collections_;
    };

} // namespace services::transaction
