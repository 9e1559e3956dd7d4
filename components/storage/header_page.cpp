#include "header_page.hpp"

namespace components::storage {

    header_page_t::header_page_t(page_id_t id)
        : page_t(id, kind) {}

    page_ptr header_page_t::clone() const { return std::make_unique<header_page_t>(*this); }

    std::optional<page_id_t> header_page_t::find_collection(std::string_view name) const {
        auto it = collections_.find(name);
        if (it == collections_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void header_page_t::add_collection(std::string_view name, page_id_t page_id) {
        auto [it, inserted] = collections_.emplace(std::string(name), page_id);
        if (!inserted) {
            throw base::already_exists_collection_name(name);
        }
    }

    bool header_page_t::remove_collection(std::string_view name) {
        auto it = collections_.find(name);
        if (it == collections_.end()) {
            return false;
        }
        collections_.erase(it);
        return true;
    }

    std::size_t header_page_t::collections_size() const noexcept {
        std::size_t size = 0;
        for (const auto& [name, page_id] : collections_) {
            size += name.size() + collection_entry_overhead;
        }
        return size;
    }

} // namespace components::storage
