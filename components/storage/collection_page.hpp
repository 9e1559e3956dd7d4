#pragma once

#include "page.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace components::storage {

    /// slot 0 is the primary key index
    constexpr std::size_t index_per_collection = 16;
    constexpr uint8_t primary_key_slot = 0;

    struct index_info_t {
        uint8_t slot{0};
        std::string name;
        std::string expression;
        bool unique{false};
        page_address_t head_node;
        page_address_t tail_node;

        bool is_empty() const noexcept { return name.empty(); }
        void clear();
    };

    /// Descriptor of a collection: name, identity sequence and its index descriptors.
    class collection_page_t final : public page_t {
    public:
        static constexpr page_type kind = page_type::collection;

        explicit collection_page_t(page_id_t id);

        page_ptr clone() const override;

        const std::string& collection_name() const noexcept { return collection_name_; }
        void set_collection_name(std::string_view name) { collection_name_ = std::string(name); }

        int64_t sequence() const noexcept { return sequence_; }
        void set_sequence(int64_t value) noexcept { sequence_ = value; }

        uint64_t document_count() const noexcept { return document_count_; }
        void set_document_count(uint64_t count) noexcept { document_count_ = count; }

        page_id_t free_data_page_id() const noexcept { return free_data_page_id_; }
        void set_free_data_page_id(page_id_t id) noexcept { free_data_page_id_ = id; }
        page_id_t free_index_page_id() const noexcept { return free_index_page_id_; }
        void set_free_index_page_id(page_id_t id) noexcept { free_index_page_id_ = id; }

        index_info_t& pk() noexcept { return indexes_[primary_key_slot]; }
        const index_info_t& pk() const noexcept { return indexes_[primary_key_slot]; }

        /// used index descriptors ordered by slot
        std::vector<index_info_t*> get_indexes(bool include_pk);
        index_info_t* get_index(std::string_view name) noexcept;
        /// first unused slot or nullptr when every slot is taken
        index_info_t* get_free_index() noexcept;

    private:
        std::string collection_name_;
        int64_t sequence_{0};
        uint64_t document_count_{0};
        page_id_t free_data_page_id_{invalid_page_id};
        page_id_t free_index_page_id_{invalid_page_id};
        std::array<index_info_t, index_per_collection> indexes_;
    };

} // namespace components::storage
