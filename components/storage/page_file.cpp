#include "page_file.hpp"
#include "header_page.hpp"

#include <mutex>

namespace components::storage {

    page_file_t::page_file_t(std::pmr::memory_resource* resource)
        : resource_(resource)
        , pages_(resource)
        , free_list_(resource) {
        pages_.emplace(header_page_id, std::make_unique<header_page_t>(header_page_id));
    }

    page_ptr page_file_t::read(page_id_t id) const {
        std::shared_lock lock(mutex_);
        auto it = pages_.find(id);
        if (it == pages_.end()) {
            throw base::page_not_found(id);
        }
        return it->second->clone();
    }

    bool page_file_t::exists(page_id_t id) const {
        std::shared_lock lock(mutex_);
        return pages_.find(id) != pages_.end();
    }

    page_id_t page_file_t::allocate() {
        std::unique_lock lock(mutex_);
        if (!free_list_.empty()) {
            auto id = free_list_.back();
            free_list_.pop_back();
            return id;
        }
        return ++last_page_id_;
    }

    void page_file_t::release(const std::pmr::vector<page_id_t>& ids) {
        if (ids.empty()) {
            return;
        }
        std::unique_lock lock(mutex_);
        free_list_.insert(free_list_.end(), ids.begin(), ids.end());
    }

    void page_file_t::commit(std::pmr::vector<page_ptr>&& dirty, const std::pmr::vector<page_id_t>& deleted) {
        std::unique_lock lock(mutex_);
        for (auto& page : dirty) {
            auto id = page->id();
            pages_[id] = std::move(page);
        }
        for (auto id : deleted) {
            pages_.erase(id);
            free_list_.push_back(id);
        }
    }

    std::size_t page_file_t::page_count() const {
        std::shared_lock lock(mutex_);
        return pages_.size();
    }

    std::size_t page_file_t::free_count() const {
        std::shared_lock lock(mutex_);
        return free_list_.size();
    }

} // namespace components::storage
