#pragma once

#include "page.hpp"

#include <components/document/value.hpp>

#include <map>

namespace components::storage {

    constexpr uint8_t max_level_length = 32;
    constexpr std::size_t max_index_key_length = 512;
    // slot, levels, key length + position, data block, primary and next node addresses
    constexpr std::size_t index_node_fixed_size = 1 + 1 + 2 + page_address_t::size * 4;

    /// Skip list node. Primary nodes chain the secondary nodes of the same document through `next_node`,
    /// secondary nodes point back to their primary node through `primary`.
    struct index_node_t {
        page_address_t position;
        uint8_t slot{0};
        document::value_t key;
        page_address_t data_block;
        page_address_t primary;
        page_address_t next_node;
        std::vector<page_address_t> prev;
        std::vector<page_address_t> next;

        index_node_t() = default;
        index_node_t(uint8_t slot, uint8_t levels, document::value_t key);

        uint8_t levels() const noexcept { return static_cast<uint8_t>(next.size()); }
        std::size_t length() const noexcept;
    };

    class index_page_t final : public page_t {
    public:
        static constexpr page_type kind = page_type::index;
        using nodes_t = std::map<uint16_t, index_node_t>;

        explicit index_page_t(page_id_t id);

        page_ptr clone() const override;

        index_node_t& add_node(index_node_t node);
        index_node_t* get_node(uint16_t index) noexcept;
        void delete_node(uint16_t index);

        const nodes_t& nodes() const noexcept { return nodes_; }
        std::size_t items_count() const noexcept { return nodes_.size(); }
        std::size_t free_bytes() const noexcept { return page_available_bytes - used_bytes_; }

    private:
        nodes_t nodes_;
        std::size_t used_bytes_{0};
    };

} // namespace components::storage
