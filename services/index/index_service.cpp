#include "index_service.hpp"

namespace services::index {

    using namespace components::storage;
    using components::document::value_t;

    namespace {

        bool is_sentinel(const index_node_t& node) noexcept {
            return node.key.is_min_value() || node.key.is_max_value();
        }

    } // namespace

    node_range_t::iterator_t::iterator_t(index_service_t* service, pointer node, index_order_t order)
        : service_(service)
        , node_(node)
        , order_(order) {}

    node_range_t::iterator_t& node_range_t::iterator_t::operator++() {
        auto next = order_ == index_order_t::ascending ? node_->next[0] : node_->prev[0];
        node_ = next.is_empty() ? nullptr : service_->get_node(next);
        if (node_ && is_sentinel(*node_)) {
            node_ = nullptr;
        }
        return *this;
    }

    node_range_t::node_range_t(index_service_t* service, page_address_t start, index_order_t order)
        : service_(service)
        , start_(start)
        , order_(order) {}

    node_range_t::iterator_t node_range_t::begin() const {
        iterator_t it(service_, service_->get_node(start_), order_);
        return ++it;
    }

    index_service_t::index_service_t(transaction::page_service_t& pager, log_t log)
        : pager_(pager)
        , log_(std::move(log))
        , random_(std::random_device{}()) {}

    index_info_t& index_service_t::create_index(collection_page_t& collection,
                                                std::string_view name,
                                                std::string_view expression,
                                                bool unique) {
        auto* index = collection.get_free_index();
        if (!index) {
            throw components::base::index_limit_exceeded(collection.collection_name(), index_per_collection);
        }

        index_node_t head_node(index->slot, max_level_length, value_t::min_value());
        index_node_t tail_node(index->slot, max_level_length, value_t::max_value());
        auto* page = free_index_page_(collection, head_node.length() + tail_node.length());
        auto& head = page->add_node(std::move(head_node));
        auto& tail = page->add_node(std::move(tail_node));
        for (uint8_t level = 0; level < max_level_length; ++level) {
            head.next[level] = tail.position;
            tail.prev[level] = head.position;
        }
        pager_.set_dirty(*page);

        index->name = std::string(name);
        index->expression = std::string(expression);
        index->unique = unique;
        index->head_node = head.position;
        index->tail_node = tail.position;
        pager_.set_dirty(collection);
        debug(log_,
              "index_service_t::create_index: '{}' ({}) in slot {} of '{}'",
              name,
              expression,
              index->slot,
              collection.collection_name());
        return *index;
    }

    index_node_t& index_service_t::add_node(collection_page_t& collection,
                                            const index_info_t& index,
                                            value_t key,
                                            page_address_t data_block,
                                            index_node_t* primary) {
        if (key.is_min_value() || key.is_max_value()) {
            throw components::base::invalid_data_type(index.name, key.to_string());
        }
        auto key_length = key.estimated_size();
        if (key_length > max_index_key_length) {
            throw components::base::index_key_too_long(index.name, key_length, max_index_key_length);
        }

        // predecessors on every level, checked for a duplicate before anything is written
        std::array<index_node_t*, max_level_length> update{};
        auto* current = get_node(index.head_node);
        for (int level = max_level_length - 1; level >= 0; --level) {
            for (auto address = current->next[level]; !address.is_empty(); address = current->next[level]) {
                auto* next = get_node(address);
                if (next->key.is_max_value()) {
                    break;
                }
                auto diff = next->key.compare(key);
                if (diff == 0 && index.unique) {
                    throw components::base::index_duplicate_key(index.name, key.to_string());
                }
                if (diff > 0) {
                    break;
                }
                current = next;
            }
            update[static_cast<std::size_t>(level)] = current;
        }

        auto levels = flip();
        index_node_t candidate(index.slot, levels, std::move(key));
        candidate.data_block = data_block;
        auto* page = free_index_page_(collection, candidate.length());
        auto& node = page->add_node(std::move(candidate));
        pager_.set_dirty(*page);

        for (uint8_t level = 0; level < levels; ++level) {
            auto* previous = update[level];
            auto* next = get_node(previous->next[level]);
            node.prev[level] = previous->position;
            node.next[level] = next->position;
            previous->next[level] = node.position;
            next->prev[level] = node.position;
            set_dirty(*previous);
            set_dirty(*next);
        }

        if (primary) {
            node.primary = primary->position;
            node.next_node = primary->next_node;
            primary->next_node = node.position;
            set_dirty(*primary);
        }
        return node;
    }

    index_node_t* index_service_t::get_node(page_address_t address) {
        auto* page = pager_.get_page<index_page_t>(address.page_id);
        auto* node = page->get_node(address.index);
        if (!node) {
            throw components::base::storage_corrupted(fmt::format("index node {} does not exist", address.to_string()));
        }
        return node;
    }

    index_node_t* index_service_t::find(const index_info_t& index, const value_t& key) {
        auto* current = get_node(index.head_node);
        for (int level = max_level_length - 1; level >= 0; --level) {
            for (auto address = current->next[level]; !address.is_empty(); address = current->next[level]) {
                auto* next = get_node(address);
                if (next->key.is_max_value() || next->key.compare(key) >= 0) {
                    break;
                }
                current = next;
            }
        }
        auto* candidate = get_node(current->next[0]);
        if (candidate->key.is_max_value() || candidate->key.compare(key) != 0) {
            return nullptr;
        }
        return candidate;
    }

    node_range_t index_service_t::find_all(const index_info_t& index, index_order_t order) {
        return {this, order == index_order_t::ascending ? index.head_node : index.tail_node, order};
    }

    void index_service_t::delete_node(collection_page_t& collection, page_address_t position) {
        auto* node = get_node(position);
        for (uint8_t level = 0; level < node->levels(); ++level) {
            auto* previous = get_node(node->prev[level]);
            auto* next = get_node(node->next[level]);
            previous->next[level] = node->next[level];
            next->prev[level] = node->prev[level];
            set_dirty(*previous);
            set_dirty(*next);
        }

        auto* page = pager_.get_page<index_page_t>(position.page_id);
        page->delete_node(position.index);
        if (page->items_count() == 0) {
            pager_.delete_page(page->id());
            if (collection.free_index_page_id() == position.page_id) {
                collection.set_free_index_page_id(invalid_page_id);
                pager_.set_dirty(collection);
            }
        } else {
            pager_.set_dirty(*page);
        }
    }

    void index_service_t::delete_secondary(collection_page_t& collection, index_node_t& primary) {
        auto address = primary.next_node;
        while (!address.is_empty()) {
            auto next = get_node(address)->next_node;
            delete_node(collection, address);
            address = next;
        }
        primary.next_node = page_address_t();
        set_dirty(primary);
    }

    void index_service_t::set_dirty(const index_node_t& node) {
        pager_.set_dirty(*pager_.get_page<index_page_t>(node.position.page_id));
    }

    uint8_t index_service_t::flip() {
        uint8_t levels = 1;
        while (levels < max_level_length && (random_() & 1u) == 1u) {
            ++levels;
        }
        return levels;
    }

    index_page_t* index_service_t::free_index_page_(collection_page_t& collection, std::size_t length) {
        if (collection.free_index_page_id() != invalid_page_id) {
            auto* page = pager_.get_page<index_page_t>(collection.free_index_page_id());
            if (page->free_bytes() >= length) {
                return page;
            }
        }
        auto* page = pager_.new_page<index_page_t>();
        collection.set_free_index_page_id(page->id());
        pager_.set_dirty(collection);
        return page;
    }

} // namespace services::index
