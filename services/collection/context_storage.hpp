#pragma once

#include "collection_service.hpp"

#include <components/log/log.hpp>
#include <services/data/data_service.hpp>
#include <services/index/index_service.hpp>
#include <services/transaction/page_service.hpp>
#include <services/transaction/transaction.hpp>

namespace services {

    /// Services of one transaction, all reading and writing pages through it.
    struct context_storage_t {
        std::pmr::memory_resource* resource;
        log_t log;
        transaction::transaction_t transaction;
        transaction::page_service_t pager;
        data::data_service_t data;
        index::index_service_t indexer;
        collection::collection_service_t collections;

        context_storage_t(std::pmr::memory_resource* resource,
                          components::storage::page_file_t& file,
                          transaction::lock_service_t& locks,
                          log_t log,
                          std::size_t max_collections_size)
            : resource(resource)
            , log(std::move(log))
            , transaction(resource, file, locks, this->log)
            , pager(transaction)
            , data(pager, this->log)
            , indexer(pager, this->log)
            , collections(pager, data, indexer, this->log, max_collections_size) {}

        context_storage_t(const context_storage_t&) = delete;
        context_storage_t& operator=(const context_storage_t&) = delete;
    };

} //namespace services
