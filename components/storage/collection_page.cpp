#include "collection_page.hpp"

namespace components::storage {

    void index_info_t::clear() {
        name.clear();
        expression.clear();
        unique = false;
        head_node = page_address_t();
        tail_node = page_address_t();
    }

    collection_page_t::collection_page_t(page_id_t id)
        : page_t(id, kind) {
        for (std::size_t i = 0; i < indexes_.size(); ++i) {
            indexes_[i].slot = static_cast<uint8_t>(i);
        }
    }

    page_ptr collection_page_t::clone() const { return std::make_unique<collection_page_t>(*this); }

    std::vector<index_info_t*> collection_page_t::get_indexes(bool include_pk) {
        std::vector<index_info_t*> result;
        for (auto& index : indexes_) {
            if (index.is_empty() || (!include_pk && index.slot == primary_key_slot)) {
                continue;
            }
            result.push_back(&index);
        }
        return result;
    }

    index_info_t* collection_page_t::get_index(std::string_view name) noexcept {
        for (auto& index : indexes_) {
            if (!index.is_empty() && index.name == name) {
                return &index;
            }
        }
        return nullptr;
    }

    index_info_t* collection_page_t::get_free_index() noexcept {
        for (auto& index : indexes_) {
            if (index.is_empty()) {
                return &index;
            }
        }
        return nullptr;
    }

} // namespace components::storage
