#include "document_writer.hpp"

#include <components/document/msgpack/msgpack_encoder.hpp>
#include <components/expressions/path_expression.hpp>
#include <core/string_utils.hpp>

#include <algorithm>
#include <stdexcept>

namespace services::collection {

    using namespace components::document;
    using components::storage::collection_page_t;
    using components::storage::index_info_t;
    using components::storage::index_node_t;
    using components::storage::page_address_t;

    namespace {

        // the sequence wraps around instead of overflowing
        int64_t shift_sequence(int64_t sequence, int64_t delta) noexcept {
            return static_cast<int64_t>(static_cast<uint64_t>(sequence) + static_cast<uint64_t>(delta));
        }

    } // namespace

    void check_identity(const value_t& id) {
        if (id.is_null() || id.is_min_value() || id.is_max_value()) {
            throw components::base::invalid_data_type(id_field, id.to_string());
        }
    }

    std::pmr::vector<value_t>
    index_keys(std::pmr::memory_resource* resource, const index_info_t& index, const document_t& document) {
        components::expressions::path_expression_t expression(resource, index.expression);
        auto keys = expression.execute(document, true);
        if (index.unique) {
            std::sort(keys.begin(), keys.end());
            keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
        }
        return keys;
    }

    document_writer_t::document_writer_t(context_storage_t& context, identity_generator_t& generator)
        : context_(context)
        , generator_(generator) {}

    std::size_t document_writer_t::insert(std::string_view collection, const documents_t& documents, auto_id_t auto_id) {
        check_arguments_(collection, documents);
        debug(context_.log,
              "document_writer_t::insert: '{}', documents: {}, auto id: {}",
              collection,
              documents.size(),
              to_string(auto_id));

        context_.transaction.write_lock(collection);
        auto* page = context_.collections.get_or_add(collection);
        std::size_t count = 0;
        for (const auto& document : documents) {
            insert_one(*page, *document, auto_id);
            ++count;
        }
        context_.transaction.commit();
        return count;
    }

    std::size_t document_writer_t::upsert(std::string_view collection, const documents_t& documents, auto_id_t auto_id) {
        check_arguments_(collection, documents);
        debug(context_.log, "document_writer_t::upsert: '{}', documents: {}", collection, documents.size());

        context_.transaction.write_lock(collection);
        auto* page = context_.collections.get_or_add(collection);
        std::size_t count = 0;
        for (const auto& document : documents) {
            if (document->get(id_field).is_null() || !update_one(*page, *document)) {
                insert_one(*page, *document, auto_id);
                ++count;
            }
        }
        context_.transaction.commit();
        trace(context_.log, "document_writer_t::upsert: '{}', inserted: {}", collection, count);
        return count;
    }

    std::size_t document_writer_t::update(std::string_view collection, const documents_t& documents) {
        check_arguments_(collection, documents);
        debug(context_.log, "document_writer_t::update: '{}', documents: {}", collection, documents.size());

        context_.transaction.write_lock(collection);
        auto* page = context_.collections.get(collection);
        if (!page) {
            context_.transaction.rollback();
            return 0;
        }
        std::size_t count = 0;
        for (const auto& document : documents) {
            if (update_one(*page, *document)) {
                ++count;
            }
        }
        context_.transaction.commit();
        return count;
    }

    void document_writer_t::insert_one(collection_page_t& collection, document_t& document, auto_id_t auto_id) {
        collection.set_sequence(shift_sequence(collection.sequence(), 1));
        context_.pager.set_dirty(collection);

        value_t id;
        if (const auto* existing = document.find(id_field)) {
            id = *existing;
            if (auto_id == auto_id_t::int32 || auto_id == auto_id_t::int64) {
                // an explicit id above the sequence moves it forward, a lower one gives back the increment
                auto current = id.as_int64();
                collection.set_sequence(current >= collection.sequence() ? current
                                                                         : shift_sequence(collection.sequence(), -1));
            }
        } else {
            id = generate_id_(auto_id, collection.sequence());
            document.set_front(id_field, id);
        }

        check_identity(id);

        auto bytes = serialize(document);
        auto data_block = context_.data.insert(collection, bytes);
        auto& primary = context_.indexer.add_node(collection, collection.pk(), id, data_block, nullptr);
        add_secondary_(collection, document, data_block, primary);

        collection.set_document_count(collection.document_count() + 1);
        trace(context_.log,
              "document_writer_t::insert_one: '{}' _id {} at {}",
              collection.collection_name(),
              id.to_string(),
              data_block.to_string());
    }

    bool document_writer_t::update_one(collection_page_t& collection, const document_t& document) {
        auto id = document.get(id_field);
        check_identity(id);

        auto* primary = context_.indexer.find(collection.pk(), id);
        if (!primary) {
            return false;
        }

        auto bytes = serialize(document);
        context_.data.update(collection, primary->data_block, bytes);
        context_.indexer.delete_secondary(collection, *primary);
        add_secondary_(collection, document, primary->data_block, *primary);
        trace(context_.log, "document_writer_t::update_one: '{}' _id {}", collection.collection_name(), id.to_string());
        return true;
    }

    bool document_writer_t::ensure_index(std::string_view collection,
                                         std::string_view name,
                                         std::string_view expression,
                                         bool unique) {
        if (core::is_blank(collection)) {
            throw components::base::argument_error("collection");
        }
        if (!collection_service_t::is_valid_name(name)) {
            throw components::base::invalid_format(name);
        }
        if (!components::expressions::path_expression_t::is_valid(expression)) {
            throw components::base::invalid_format(expression);
        }

        context_.transaction.write_lock(collection);
        auto* page = context_.collections.get_or_add(collection);
        if (page->get_index(name)) {
            return false;
        }
        auto& created = context_.indexer.create_index(*page, name, expression, unique);

        // pk positions first: adding nodes while walking the pk chain would move the walk
        std::pmr::vector<page_address_t> primaries(context_.resource);
        for (const auto& node : context_.indexer.find_all(page->pk(), index::index_order_t::ascending)) {
            primaries.push_back(node.position);
        }
        for (auto position : primaries) {
            auto* primary = context_.indexer.get_node(position);
            auto data_block = primary->data_block;
            auto document = deserialize(context_.data.read(data_block));
            for (auto& key : index_keys(context_.resource, created, document)) {
                context_.indexer.add_node(*page, created, std::move(key), data_block, primary);
            }
        }
        context_.transaction.commit();
        info(context_.log,
             "document_writer_t::ensure_index: '{}' ({}) on '{}', documents: {}",
             name,
             expression,
             collection,
             primaries.size());
        return true;
    }

    void document_writer_t::check_arguments_(std::string_view collection, const documents_t& documents) const {
        if (core::is_blank(collection)) {
            throw components::base::argument_error("collection");
        }
        for (const auto& document : documents) {
            if (!document) {
                throw components::base::argument_error("documents");
            }
        }
    }

    value_t document_writer_t::generate_id_(auto_id_t auto_id, int64_t sequence) {
        switch (auto_id) {
            case auto_id_t::object_id:
                return value_t(generator_.object_id());
            case auto_id_t::guid:
                return value_t(generator_.guid());
            case auto_id_t::datetime:
                return value_t(generator_.timestamp());
            case auto_id_t::int32:
                return value_t(static_cast<int32_t>(sequence));
            case auto_id_t::int64:
                return value_t(sequence);
        }
        throw std::logic_error("unknown auto id mode");
    }

    void document_writer_t::add_secondary_(collection_page_t& collection,
                                           const document_t& document,
                                           page_address_t data_block,
                                           index_node_t& primary) {
        for (auto* index : collection.get_indexes(false)) {
            for (auto& key : index_keys(context_.resource, *index, document)) {
                context_.indexer.add_node(collection, *index, std::move(key), data_block, &primary);
            }
        }
    }

} // namespace services::collection
