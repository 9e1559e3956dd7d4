#pragma once

#include <components/log/log.hpp>
#include <components/storage/collection_page.hpp>
#include <components/storage/index_page.hpp>
#include <services/transaction/page_service.hpp>

#include <array>
#include <iterator>
#include <random>

namespace services::index {

    enum class index_order_t : int8_t
    {
        ascending = 1,
        descending = -1
    };

    class index_service_t;

    /// Lazy walk over the level-0 chain of an index, sentinels excluded.
    /// Every `begin()` starts again from the sentinel and reads pages through the current transaction.
    class node_range_t final {
    public:
        class iterator_t final {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = components::storage::index_node_t;
            using difference_type = std::ptrdiff_t;
            using pointer = components::storage::index_node_t*;
            using reference = components::storage::index_node_t&;

            iterator_t() = default;
            iterator_t(index_service_t* service, pointer node, index_order_t order);

            reference operator*() const { return *node_; }
            pointer operator->() const { return node_; }
            iterator_t& operator++();
            bool operator==(const iterator_t& other) const noexcept { return node_ == other.node_; }
            bool operator!=(const iterator_t& other) const noexcept { return node_ != other.node_; }

        private:
            index_service_t* service_{nullptr};
            pointer node_{nullptr};
            index_order_t order_{index_order_t::ascending};
        };

        node_range_t(index_service_t* service, components::storage::page_address_t start, index_order_t order);

        iterator_t begin() const;
        iterator_t end() const { return {}; }

    private:
        index_service_t* service_;
        components::storage::page_address_t start_;
        index_order_t order_;
    };

    /// Skip list indexes stored in index pages.
    ///
    /// Each index starts at a head node keyed by the min value and ends at a tail node keyed
    /// by the max value; both carry every level. A secondary node points to the primary node
    /// of its document through `primary`, and the primary node chains all of them through `next_node`.
    class index_service_t {
    public:
        index_service_t(transaction::page_service_t& pager, log_t log);

        /// Takes the first free slot of `collection`, throws index_limit_exceeded when none is left.
        components::storage::index_info_t& create_index(components::storage::collection_page_t& collection,
                                                        std::string_view name,
                                                        std::string_view expression,
                                                        bool unique);

        components::storage::index_node_t& add_node(components::storage::collection_page_t& collection,
                                                    const components::storage::index_info_t& index,
                                                    components::document::value_t key,
                                                    components::storage::page_address_t data_block,
                                                    components::storage::index_node_t* primary);

        components::storage::index_node_t* get_node(components::storage::page_address_t address);
        /// first node equal to `key`, nullptr if there is none
        components::storage::index_node_t* find(const components::storage::index_info_t& index,
                                                const components::document::value_t& key);
        node_range_t find_all(const components::storage::index_info_t& index, index_order_t order);

        void delete_node(components::storage::collection_page_t& collection,
                         components::storage::page_address_t position);
        /// removes every secondary node chained after `primary`
        void delete_secondary(components::storage::collection_page_t& collection,
                              components::storage::index_node_t& primary);

        void set_dirty(const components::storage::index_node_t& node);

        /// random level for a new node, 1..max_level_length
        uint8_t flip();

    private:
        components::storage::index_page_t* free_index_page_(components::storage::collection_page_t& collection,
                                                            std::size_t length);

        transaction::page_service_t& pager_;
        log_t log_;
        std::mt19937 random_;
    };

} // namespace services::index
