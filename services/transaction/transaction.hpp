#pragma once

#include "lock_service.hpp"

#include <components/log/log.hpp>
#include <components/storage/page_file.hpp>

#include <memory_resource>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace services::transaction {

    /// Unit of work over the page file.
    ///
    /// Every page read is copied into the transaction on first access and stays private to it;
    /// pages marked dirty, created or deleted are published together by `commit`.
    /// `rollback`, or destruction of an uncommitted transaction, discards all of it and
    /// releases every lock taken.
    class transaction_t {
    public:
        transaction_t(std::pmr::memory_resource* resource,
                      components::storage::page_file_t& file,
                      lock_service_t& locks,
                      log_t log);
        ~transaction_t();
        transaction_t(const transaction_t&) = delete;
        transaction_t& operator=(const transaction_t&) = delete;

        uint64_t id() const noexcept { return id_; }
        bool is_active() const noexcept { return active_; }
        std::pmr::memory_resource* resource() const noexcept { return resource_; }

        template<class T>
        T* get_page(components::storage::page_id_t id) {
            return components::storage::page_cast<T>(load_(id));
        }

        /// new zero-initialized page, already dirty
        template<class T>
        T* new_page() {
            check_active_();
            auto id = file_.allocate();
            new_pages_.insert(id);
            auto page = std::make_unique<T>(id);
            auto* result = page.get();
            pages_[id] = std::move(page);
            dirty_.insert(id);
            return result;
        }

        void set_dirty(const components::storage::page_t& page);
        bool is_dirty(components::storage::page_id_t id) const noexcept;
        void delete_page(components::storage::page_id_t id);

        /// Blocks until the header lock is held; the header is re-read afterwards
        /// so decisions taken under the lock see the last committed directory.
        void lock_header();
        bool holds_header_lock() const noexcept { return header_lock_.has_value(); }
        /// Blocks until the write lock of `collection` is held. Reentrant within a transaction.
        void write_lock(std::string_view collection);

        void commit();
        void rollback() noexcept;

        std::size_t dirty_count() const noexcept { return dirty_.size(); }

    private:
        components::storage::page_t* load_(components::storage::page_id_t id);
        void check_active_() const;
        void release_locks_() noexcept;

        std::pmr::memory_resource* resource_;
        components::storage::page_file_t& file_;
        lock_service_t& locks_;
        log_t log_;
        uint64_t id_;
        bool active_{true};

        std::pmr::unordered_map<components::storage::page_id_t, components::storage::page_ptr> pages_;
        std::pmr::unordered_set<components::storage::page_id_t> dirty_;
        std::pmr::unordered_set<components::storage::page_id_t> new_pages_;
        std::pmr::unordered_set<components::storage::page_id_t> deleted_;

        std::optional<std::unique_lock<std::mutex>> header_lock_;
        std::pmr::vector<std::unique_lock<std::mutex>> collection_locks_;
        std::pmr::set<std::string, core::iless> locked_collections_;
    };

} // namespace services::transaction
