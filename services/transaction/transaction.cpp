#include "transaction.hpp"

#include <components/storage/header_page.hpp>

namespace services::transaction {

    using components::storage::header_page_id;
    using components::storage::header_page_t;
    using components::storage::page_id_t;
    using components::storage::page_ptr;
    using components::storage::page_t;

    transaction_t::transaction_t(std::pmr::memory_resource* resource,
                                 components::storage::page_file_t& file,
                                 lock_service_t& locks,
                                 log_t log)
        : resource_(resource)
        , file_(file)
        , locks_(locks)
        , log_(std::move(log))
        , id_(file.next_transaction_id())
        , pages_(resource)
        , dirty_(resource)
        , new_pages_(resource)
        , deleted_(resource)
        , collection_locks_(resource)
        , locked_collections_(resource) {
        trace(log_, "transaction_t::begin: {}", id_);
    }

    transaction_t::~transaction_t() {
        if (active_) {
            rollback();
        }
    }

    page_t* transaction_t::load_(page_id_t id) {
        check_active_();
        if (deleted_.count(id) != 0) {
            throw components::base::page_not_found(id);
        }
        auto it = pages_.find(id);
        if (it == pages_.end()) {
            it = pages_.emplace(id, file_.read(id)).first;
        }
        return it->second.get();
    }

    void transaction_t::set_dirty(const page_t& page) {
        check_active_();
        auto id = page.id();
        auto it = pages_.find(id);
        if (it == pages_.end() || it->second.get() != &page) {
            throw components::base::storage_corrupted(
                fmt::format("page #{} marked dirty is not owned by transaction {}", id, id_));
        }
        dirty_.insert(id);
    }

    bool transaction_t::is_dirty(page_id_t id) const noexcept { return dirty_.count(id) != 0; }

    void transaction_t::delete_page(page_id_t id) {
        check_active_();
        if (id == header_page_id) {
            throw components::base::storage_corrupted("header page can not be deleted");
        }
        pages_.erase(id);
        dirty_.erase(id);
        deleted_.insert(id);
    }

    void transaction_t::lock_header() {
        check_active_();
        if (header_lock_) {
            return;
        }
        trace(log_, "transaction_t::lock_header: {} waiting", id_);
        header_lock_.emplace(locks_.lock_header());

        auto it = pages_.find(header_page_id);
        if (it != pages_.end() && !is_dirty(header_page_id)) {
            // refresh in place: callers may still hold the header pointer
            auto fresh = file_.read(header_page_id);
            *components::storage::page_cast<header_page_t>(it->second.get()) =
                *components::storage::page_cast<header_page_t>(fresh.get());
        }
    }

    void transaction_t::write_lock(std::string_view collection) {
        check_active_();
        if (locked_collections_.find(collection) != locked_collections_.end()) {
            return;
        }
        trace(log_, "transaction_t::write_lock: {} waiting for '{}'", id_, collection);
        collection_locks_.push_back(locks_.lock_collection(collection));
        locked_collections_.emplace(collection);
    }

    void transaction_t::commit() {
        check_active_();
        std::pmr::vector<page_ptr> dirty(resource_);
        dirty.reserve(dirty_.size());
        for (auto id : dirty_) {
            auto it = pages_.find(id);
            if (it != pages_.end()) {
                dirty.push_back(std::move(it->second));
            }
        }
        std::pmr::vector<page_id_t> deleted(deleted_.begin(), deleted_.end(), resource_);
        auto dirty_count = dirty.size();

        file_.commit(std::move(dirty), deleted);

        active_ = false;
        pages_.clear();
        dirty_.clear();
        new_pages_.clear();
        deleted_.clear();
        release_locks_();
        debug(log_, "transaction_t::commit: {}, dirty pages: {}, deleted pages: {}", id_, dirty_count, deleted.size());
    }

    void transaction_t::rollback() noexcept {
        if (!active_) {
            return;
        }
        try {
            std::pmr::vector<page_id_t> allocated(new_pages_.begin(), new_pages_.end(), resource_);
            file_.release(allocated);
        } catch (const std::exception& e) {
            error(log_, "transaction_t::rollback: {} can not release allocated pages: {}", id_, e.what());
        }
        active_ = false;
        pages_.clear();
        dirty_.clear();
        new_pages_.clear();
        deleted_.clear();
        release_locks_();
        debug(log_, "transaction_t::rollback: {}", id_);
    }

    void transaction_t::check_active_() const {
        if (!active_) {
            throw components::base::transaction_closed(id_);
        }
    }

    void transaction_t::release_locks_() noexcept {
        // collection locks were taken before the header lock; release in reverse order
        header_lock_.reset();
        while (!collection_locks_.empty()) {
            collection_locks_.pop_back();
        }
        locked_collections_.clear();
    }

} // namespace services::transaction
