#pragma once

#include "page.hpp"

#include <map>

namespace components::storage {

    // position, extend page id, document length, checksum, in-page data length
    constexpr std::size_t data_block_fixed_size = page_address_t::size + 4 + 4 + 4 + 2;
    /// a document smaller than this is never split between a data page and extend pages
    constexpr std::size_t min_block_data_length = 256;
    constexpr std::size_t extend_page_capacity = page_available_bytes - 4;

    /// Encoded document, or its first part when the rest continues in a chain of extend pages.
    struct data_block_t {
        page_address_t position;
        page_id_t extend_page_id{invalid_page_id};
        uint32_t document_length{0};
        uint32_t checksum{0};
        buffer_t data;

        std::size_t length() const noexcept { return data_block_fixed_size + data.size(); }
    };

    class data_page_t final : public page_t {
    public:
        static constexpr page_type kind = page_type::data;
        using blocks_t = std::map<uint16_t, data_block_t>;

        explicit data_page_t(page_id_t id);

        page_ptr clone() const override;

        data_block_t& add_block(data_block_t block);
        data_block_t* get_block(uint16_t index) noexcept;
        /// replaces the in-page data of a block, keeping page accounting right
        void update_block(uint16_t index, buffer_t data);
        void delete_block(uint16_t index);

        const blocks_t& blocks() const noexcept { return blocks_; }
        std::size_t items_count() const noexcept { return blocks_.size(); }
        std::size_t free_bytes() const noexcept { return page_available_bytes - used_bytes_; }

    private:
        blocks_t blocks_;
        std::size_t used_bytes_{0};
    };

    /// Overflow continuation of a data block.
    class extend_page_t final : public page_t {
    public:
        static constexpr page_type kind = page_type::extend;

        explicit extend_page_t(page_id_t id);

        page_ptr clone() const override;

        const buffer_t& data() const noexcept { return data_; }
        void set_data(buffer_t data);

        page_id_t next_page_id() const noexcept { return next_page_id_; }
        void set_next_page_id(page_id_t id) noexcept { next_page_id_ = id; }

    private:
        buffer_t data_;
        page_id_t next_page_id_{invalid_page_id};
    };

} // namespace components::storage
