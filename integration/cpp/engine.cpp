#include "engine.hpp"

#include <components/document/msgpack/msgpack_encoder.hpp>
#include <services/collection/context_storage.hpp>
#include <services/collection/document_writer.hpp>

#include <stdexcept>

namespace burrowdb {

    using components::document::auto_id_t;
    using components::document::document_t;
    using components::document::documents_t;
    using components::document::value_t;
    using services::collection::document_writer_t;

    engine_t::engine_t(const configuration::config& config,
                       std::unique_ptr<components::document::identity_generator_t> generator)
        : main_path_(config.main_path)
        , storage_config_(config.storage)
        , resource_()
        , log_(initialization_logger(config.log.name, config.log.path.string()))
        , page_file_(&resource_)
        , locks_(&resource_)
        , generator_(generator ? std::move(generator)
                               : std::make_unique<components::document::default_identity_generator_t>()) {
        log_.set_level(config.log.level);
        trace(log_, "engine_t::engine_t: {}", main_path_.string());
        std::lock_guard lock(m_);
        if (paths_.find(main_path_) == paths_.end()) {
            paths_.insert(main_path_);
        } else {
            throw std::runtime_error("burrowdb instance has to have unique directory");
        }
    }

    engine_t::~engine_t() {
        trace(log_, "engine_t::~engine_t: pages: {}, free: {}", page_file_.page_count(), page_file_.free_count());
        log_.flush();
        std::lock_guard lock(m_);
        paths_.erase(main_path_);
    }

    log_t& engine_t::get_log() { return log_; }

    std::pmr::memory_resource* engine_t::resource() { return &resource_; }

    components::storage::page_file_t& engine_t::page_file() { return page_file_; }

    core::pmr::unique_ptr<services::context_storage_t> engine_t::begin_() {
        return core::pmr::make_unique<services::context_storage_t>(&resource_,
                                                                   page_file_,
                                                                   locks_,
                                                                   log_,
                                                                   storage_config_.max_collections_size);
    }

    std::size_t engine_t::insert(std::string_view collection, const documents_t& documents, auto_id_t auto_id) {
        auto context = begin_();
        return document_writer_t(*context, *generator_).insert(collection, documents, auto_id);
    }

    std::size_t engine_t::insert(std::string_view collection, const documents_t& documents) {
        return insert(collection, documents, storage_config_.default_auto_id);
    }

    std::size_t engine_t::upsert(std::string_view collection, const documents_t& documents, auto_id_t auto_id) {
        auto context = begin_();
        return document_writer_t(*context, *generator_).upsert(collection, documents, auto_id);
    }

    std::size_t engine_t::upsert(std::string_view collection, const documents_t& documents) {
        return upsert(collection, documents, storage_config_.default_auto_id);
    }

    std::size_t engine_t::update(std::string_view collection, const documents_t& documents) {
        auto context = begin_();
        return document_writer_t(*context, *generator_).update(collection, documents);
    }

    std::optional<document_t> engine_t::find_by_id(std::string_view collection, const value_t& id) {
        auto context = begin_();
        context->transaction.write_lock(collection);
        auto* page = context->collections.get(collection);
        if (!page) {
            return std::nullopt;
        }
        auto* node = context->indexer.find(page->pk(), id);
        if (!node) {
            return std::nullopt;
        }
        return components::document::deserialize(context->data.read(node->data_block));
    }

    bool engine_t::ensure_index(std::string_view collection,
                                std::string_view name,
                                std::string_view expression,
                                bool unique) {
        auto context = begin_();
        return document_writer_t(*context, *generator_).ensure_index(collection, name, expression, unique);
    }

    bool engine_t::drop_collection(std::string_view name) {
        auto context = begin_();
        context->transaction.write_lock(name);
        auto* page = context->collections.get(name);
        if (!page) {
            return false;
        }
        context->collections.drop(*page);
        context->transaction.commit();
        return true;
    }

    bool engine_t::rename_collection(std::string_view name, std::string_view new_name) {
        if (new_name.empty()) {
            throw components::base::argument_error("new_name");
        }
        auto context = begin_();
        context->transaction.write_lock(name);
        auto* page = context->collections.get(name);
        if (!page) {
            return false;
        }
        context->collections.rename(*page, new_name);
        context->transaction.commit();
        return true;
    }

    std::vector<std::string> engine_t::collection_names() {
        auto context = begin_();
        std::vector<std::string> result;
        for (const auto& page : context->collections.get_all()) {
            result.push_back(page.collection_name());
        }
        return result;
    }

    std::size_t engine_t::count(std::string_view collection) {
        auto context = begin_();
        context->transaction.write_lock(collection);
        auto* page = context->collections.get(collection);
        return page ? page->document_count() : 0;
    }

    int64_t engine_t::sequence(std::string_view collection) {
        auto context = begin_();
        context->transaction.write_lock(collection);
        auto* page = context->collections.get(collection);
        return page ? page->sequence() : 0;
    }

} // namespace burrowdb
