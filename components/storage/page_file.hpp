#pragma once

#include "page.hpp"

#include <atomic>
#include <memory_resource>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace components::storage {

    /// Committed state of every page plus the free list.
    /// Transactions only ever see copies; their changes land here atomically in `commit`.
    class page_file_t {
    public:
        explicit page_file_t(std::pmr::memory_resource* resource);
        page_file_t(const page_file_t&) = delete;
        page_file_t& operator=(const page_file_t&) = delete;

        std::pmr::memory_resource* resource() const noexcept { return resource_; }

        /// private copy of the committed page, throws page_not_found
        page_ptr read(page_id_t id) const;
        bool exists(page_id_t id) const;

        /// reserves a page id; it becomes visible only when a page with this id is committed
        page_id_t allocate();
        /// gives back ids reserved by a transaction that did not commit
        void release(const std::pmr::vector<page_id_t>& ids);

        void commit(std::pmr::vector<page_ptr>&& dirty, const std::pmr::vector<page_id_t>& deleted);

        std::size_t page_count() const;
        std::size_t free_count() const;

        uint64_t next_transaction_id() noexcept { return ++transaction_id_; }

    private:
        std::pmr::memory_resource* resource_;
        mutable std::shared_mutex mutex_;
        std::pmr::unordered_map<page_id_t, page_ptr> pages_;
        std::pmr::vector<page_id_t> free_list_;
        page_id_t last_page_id_{header_page_id};
        std::atomic<uint64_t> transaction_id_{0};
    };

} // namespace components::storage
