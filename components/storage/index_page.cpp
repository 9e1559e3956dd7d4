#include "index_page.hpp"

namespace components::storage {

    index_node_t::index_node_t(uint8_t slot, uint8_t levels, document::value_t key)
        : slot(slot)
        , key(std::move(key))
        , prev(levels)
        , next(levels) {}

    std::size_t index_node_t::length() const noexcept {
        return index_node_fixed_size + levels() * 2 * page_address_t::size + key.estimated_size();
    }

    index_page_t::index_page_t(page_id_t id)
        : page_t(id, kind) {}

    page_ptr index_page_t::clone() const { return std::make_unique<index_page_t>(*this); }

    index_node_t& index_page_t::add_node(index_node_t node) {
        uint16_t index = 0;
        // reuse the first gap left by a deleted node
        for (const auto& [used, _] : nodes_) {
            if (used != index) {
                break;
            }
            ++index;
        }
        if (index == invalid_slot_index) {
            throw base::storage_corrupted(fmt::format("index page #{} has no free slot", id()));
        }
        node.position = page_address_t(id(), index);
        used_bytes_ += node.length();
        return nodes_.emplace(index, std::move(node)).first->second;
    }

    index_node_t* index_page_t::get_node(uint16_t index) noexcept {
        auto it = nodes_.find(index);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    void index_page_t::delete_node(uint16_t index) {
        auto it = nodes_.find(index);
        if (it == nodes_.end()) {
            throw base::storage_corrupted(fmt::format("index node {}:{} does not exist", id(), index));
        }
        used_bytes_ -= it->second.length();
        nodes_.erase(it);
    }

} // namespace components::storage
