#pragma once

#include <components/log/log.hpp>
#include <components/storage/collection_page.hpp>
#include <components/storage/data_page.hpp>
#include <services/transaction/page_service.hpp>

namespace services::data {

    /// Stores encoded documents as data blocks of a collection.
    /// A block keeps as much of the document as its data page can hold; the rest continues
    /// in a chain of extend pages. Every block carries the crc32c of the whole document.
    class data_service_t {
    public:
        data_service_t(transaction::page_service_t& pager, log_t log);

        components::storage::page_address_t insert(components::storage::collection_page_t& collection,
                                                   const components::storage::buffer_t& data);
        /// copy of the block header and its in-page data, throws storage_corrupted if absent
        components::storage::data_block_t get_block(components::storage::page_address_t address);
        /// whole document bytes, following the extend chain and verifying length and checksum
        components::storage::buffer_t read(components::storage::page_address_t address);
        void update(components::storage::collection_page_t& collection,
                    components::storage::page_address_t address,
                    const components::storage::buffer_t& data);

    private:
        components::storage::data_page_t* free_data_page_(components::storage::collection_page_t& collection,
                                                          std::size_t length);
        components::storage::data_block_t* block_(components::storage::page_address_t address,
                                                  components::storage::data_page_t** page);
        components::storage::page_id_t write_extend_(const components::storage::buffer_t& data, std::size_t offset);

        transaction::page_service_t& pager_;
        log_t log_;
    };

} // namespace services::data
