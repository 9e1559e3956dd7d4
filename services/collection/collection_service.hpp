#pragma once

#include <components/log/log.hpp>
#include <components/storage/collection_page.hpp>
#include <components/storage/header_page.hpp>
#include <services/data/data_service.hpp>
#include <services/index/index_service.hpp>
#include <services/transaction/page_service.hpp>

#include <iterator>

namespace services::collection {

    constexpr std::size_t max_collection_name_length = 60;
    constexpr std::string_view primary_key_name = "_id";
    constexpr std::string_view primary_key_expression = "$._id";

    /// Lazy sequence of the collections registered in the header page.
    /// Every `begin()` reads the header again through the transaction, so no snapshot outlives it.
    class collection_range_t final {
    public:
        class iterator_t final {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = components::storage::collection_page_t;
            using difference_type = std::ptrdiff_t;
            using pointer = components::storage::collection_page_t*;
            using reference = components::storage::collection_page_t&;
            using base_iterator = components::storage::header_page_t::collections_t::const_iterator;

            iterator_t(transaction::page_service_t* pager, base_iterator it)
                : pager_(pager)
                , it_(it) {}

            reference operator*() const;
            pointer operator->() const { return &**this; }
            iterator_t& operator++() {
                ++it_;
                return *this;
            }
            bool operator==(const iterator_t& other) const noexcept { return it_ == other.it_; }
            bool operator!=(const iterator_t& other) const noexcept { return it_ != other.it_; }

        private:
            transaction::page_service_t* pager_;
            base_iterator it_;
        };

        explicit collection_range_t(transaction::page_service_t* pager)
            : pager_(pager) {}

        iterator_t begin() const;
        iterator_t end() const;

    private:
        transaction::page_service_t* pager_;
    };

    /// Life cycle of collection descriptors: lookup, creation, rename and drop.
    /// Changes of the header page require the header lock, which is taken here.
    class collection_service_t {
    public:
        collection_service_t(transaction::page_service_t& pager,
                             data::data_service_t& data,
                             index::index_service_t& indexer,
                             log_t log,
                             std::size_t max_collections_size);

        /// nullptr if `name` is not registered
        components::storage::collection_page_t* get(std::string_view name);
        components::storage::collection_page_t* get_or_add(std::string_view name);
        components::storage::collection_page_t* add(std::string_view name);
        /// Takes the header lock for the rest of the transaction.
        collection_range_t get_all();

        void rename(components::storage::collection_page_t& collection, std::string_view new_name);
        /// Releases every page of the collection; `collection` must not be used afterwards.
        void drop(components::storage::collection_page_t& collection);

        static bool is_valid_name(std::string_view name) noexcept;

    private:
        components::storage::header_page_t* header_();

        transaction::page_service_t& pager_;
        data::data_service_t& data_;
        index::index_service_t& indexer_;
        log_t log_;
        std::size_t max_collections_size_;
    };

} // namespace services::collection
