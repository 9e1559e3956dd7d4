#include "collection_service.hpp"

#include <core/string_utils.hpp>

#include <set>

namespace services::collection {

    using namespace components::storage;

    collection_range_t::iterator_t::reference collection_range_t::iterator_t::operator*() const {
        return *pager_->get_page<collection_page_t>(it_->second);
    }

    collection_range_t::iterator_t collection_range_t::begin() const {
        return {pager_, pager_->get_page<header_page_t>(header_page_id)->collections().begin()};
    }

    collection_range_t::iterator_t collection_range_t::end() const {
        return {pager_, pager_->get_page<header_page_t>(header_page_id)->collections().end()};
    }

    collection_service_t::collection_service_t(transaction::page_service_t& pager,
                                               data::data_service_t& data,
                                               index::index_service_t& indexer,
                                               log_t log,
                                               std::size_t max_collections_size)
        : pager_(pager)
        , data_(data)
        , indexer_(indexer)
        , log_(std::move(log))
        , max_collections_size_(max_collections_size) {}

    collection_page_t* collection_service_t::get(std::string_view name) {
        if (name.empty()) {
            throw components::base::argument_error("name");
        }
        auto page_id = header_()->find_collection(name);
        if (!page_id) {
            return nullptr;
        }
        return pager_.get_page<collection_page_t>(*page_id);
    }

    collection_page_t* collection_service_t::get_or_add(std::string_view name) {
        auto* collection = get(name);
        if (collection) {
            return collection;
        }
        pager_.transaction().lock_header();
        // another transaction may have created it while we waited for the lock
        collection = get(name);
        if (collection) {
            return collection;
        }
        return add(name);
    }

    collection_page_t* collection_service_t::add(std::string_view name) {
        if (name.empty()) {
            throw components::base::argument_error("name");
        }
        if (!is_valid_name(name)) {
            throw components::base::invalid_format(name);
        }
        pager_.transaction().lock_header();
        auto* header = header_();
        if (header->find_collection(name)) {
            throw components::base::already_exists_collection_name(name);
        }
        if (header->collections_size() + name.size() + collection_entry_overhead >= max_collections_size_) {
            throw components::base::collection_limit_exceeded(max_collections_size_);
        }

        auto* collection = pager_.new_page<collection_page_t>();
        collection->set_collection_name(name);
        header->add_collection(name, collection->id());
        pager_.set_dirty(*header);

        indexer_.create_index(*collection, primary_key_name, primary_key_expression, true);
        info(log_, "collection_service_t::add: '{}' on page #{}", name, collection->id());
        return collection;
    }

    collection_range_t collection_service_t::get_all() {
        // drop and rename commit under the header lock, so descriptors stay allocated while it is held
        pager_.transaction().lock_header();
        return collection_range_t(&pager_);
    }

    void collection_service_t::rename(collection_page_t& collection, std::string_view new_name) {
        for (const auto& existing : get_all()) {
            if (core::iequals(existing.collection_name(), new_name)) {
                throw components::base::already_exists_collection_name(new_name);
            }
        }
        if (!is_valid_name(new_name)) {
            throw components::base::invalid_format(new_name);
        }

        pager_.transaction().lock_header();
        auto* header = header_();
        const auto old_name = collection.collection_name();
        if (header->collections_size() - old_name.size() + new_name.size() >= max_collections_size_) {
            throw components::base::collection_limit_exceeded(max_collections_size_);
        }

        header->remove_collection(old_name);
        header->add_collection(new_name, collection.id());
        collection.set_collection_name(new_name);
        pager_.set_dirty(*header);
        pager_.set_dirty(collection);
        info(log_, "collection_service_t::rename: '{}' to '{}'", old_name, new_name);
    }

    void collection_service_t::drop(collection_page_t& collection) {
        const auto name = collection.collection_name();
        std::pmr::set<page_id_t> pages(pager_.transaction().resource());

        for (auto* index : collection.get_indexes(true)) {
            for (const auto& node : indexer_.find_all(*index, index::index_order_t::ascending)) {
                pages.insert(node.position.page_id);
                if (index->slot != primary_key_slot) {
                    continue;
                }
                pages.insert(node.data_block.page_id);
                auto block = data_.get_block(node.data_block);
                if (block.extend_page_id != invalid_page_id) {
                    pager_.delete_page(block.extend_page_id, true);
                }
            }
            pages.insert(index->head_node.page_id);
            pages.insert(index->tail_node.page_id);
        }

        for (auto page_id : pages) {
            pager_.delete_page(page_id);
        }

        pager_.transaction().lock_header();
        auto* header = header_();
        header->remove_collection(name);
        pager_.set_dirty(*header);
        pager_.delete_page(collection.id());
        info(log_, "collection_service_t::drop: '{}', {} pages released", name, pages.size() + 1);
    }

    bool collection_service_t::is_valid_name(std::string_view name) noexcept {
        if (name.empty() || name.size() > max_collection_name_length) {
            return false;
        }
        for (auto c : name) {
            bool word = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
            if (!word) {
                return false;
            }
        }
        return true;
    }

    header_page_t* collection_service_t::header_() { return pager_.get_page<header_page_t>(header_page_id); }

} // namespace services::collection
