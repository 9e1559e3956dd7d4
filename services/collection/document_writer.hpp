#pragma once

#include "context_storage.hpp"

#include <components/document/document.hpp>
#include <components/document/identity_generator.hpp>

namespace services::collection {

    /// Insert, upsert and update of document batches inside one transaction.
    ///
    /// A batch takes the write lock of its collection, applies every document and commits once.
    /// Any failure leaves the transaction uncommitted, so nothing of the batch becomes visible.
    class document_writer_t {
    public:
        document_writer_t(context_storage_t& context, components::document::identity_generator_t& generator);

        /// Returns the number of inserted documents; identities assigned here are set on the documents.
        std::size_t insert(std::string_view collection,
                           const components::document::documents_t& documents,
                           components::document::auto_id_t auto_id);
        /// Replaces documents found by `_id` and inserts the others; returns the number inserted.
        std::size_t upsert(std::string_view collection,
                           const components::document::documents_t& documents,
                           components::document::auto_id_t auto_id);
        /// Replaces documents found by `_id`; returns the number replaced.
        std::size_t update(std::string_view collection, const components::document::documents_t& documents);

        void insert_one(components::storage::collection_page_t& collection,
                        components::document::document_t& document,
                        components::document::auto_id_t auto_id);
        bool update_one(components::storage::collection_page_t& collection,
                        const components::document::document_t& document);

        /// Creates a secondary index and fills it from the stored documents.
        /// Returns false if `collection` already has an index named `name`.
        bool ensure_index(std::string_view collection, std::string_view name, std::string_view expression, bool unique);

    private:
        void check_arguments_(std::string_view collection, const components::document::documents_t& documents) const;
        components::document::value_t generate_id_(components::document::auto_id_t auto_id, int64_t sequence);
        void add_secondary_(components::storage::collection_page_t& collection,
                            const components::document::document_t& document,
                            components::storage::page_address_t data_block,
                            components::storage::index_node_t& primary);

        context_storage_t& context_;
        components::document::identity_generator_t& generator_;
    };

    /// Throws invalid_data_type for identities reserved by the index: null, min and max values.
    void check_identity(const components::document::value_t& id);

    /// Keys of `document` for `index`; a unique index gets every key once.
    std::pmr::vector<components::document::value_t> index_keys(std::pmr::memory_resource* resource,
                                                               const components::storage::index_info_t& index,
                                                               const components::document::document_t& document);

} // namespace services::collection
