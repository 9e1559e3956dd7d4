#include "data_service.hpp"

#include <absl/crc/crc32c.h>

#include <algorithm>

namespace services::data {

    using namespace components::storage;

    namespace {

        uint32_t checksum(const buffer_t& data) {
            return static_cast<uint32_t>(absl::ComputeCrc32c({data.data(), data.size()}));
        }

    } // namespace

    data_service_t::data_service_t(transaction::page_service_t& pager, log_t log)
        : pager_(pager)
        , log_(std::move(log)) {}

    page_address_t data_service_t::insert(collection_page_t& collection, const buffer_t& data) {
        auto* page = free_data_page_(collection, data.size());
        auto in_page = std::min(data.size(), page->free_bytes() - data_block_fixed_size);

        data_block_t block;
        block.document_length = static_cast<uint32_t>(data.size());
        block.checksum = checksum(data);
        block.data.assign(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(in_page));
        block.extend_page_id = write_extend_(data, in_page);

        auto position = page->add_block(std::move(block)).position;
        pager_.set_dirty(*page);
        trace(log_, "data_service_t::insert: {} bytes at {}", data.size(), position.to_string());
        return position;
    }

    data_block_t data_service_t::get_block(page_address_t address) {
        data_page_t* page = nullptr;
        return *block_(address, &page);
    }

    buffer_t data_service_t::read(page_address_t address) {
        data_page_t* page = nullptr;
        auto* block = block_(address, &page);
        buffer_t result(block->data);
        result.reserve(block->document_length);
        auto document_length = block->document_length;
        auto expected = block->checksum;

        auto next = block->extend_page_id;
        while (next != invalid_page_id) {
            auto* extend = pager_.get_page<extend_page_t>(next);
            result.insert(result.end(), extend->data().begin(), extend->data().end());
            next = extend->next_page_id();
        }

        if (result.size() != document_length) {
            throw components::base::storage_corrupted(fmt::format("data block {} holds {} bytes, {} expected",
                                                                  address.to_string(),
                                                                  result.size(),
                                                                  document_length));
        }
        if (checksum(result) != expected) {
            throw components::base::storage_corrupted(
                fmt::format("data block {} checksum mismatch", address.to_string()));
        }
        return result;
    }

    void data_service_t::update(collection_page_t& collection, page_address_t address, const buffer_t& data) {
        data_page_t* page = nullptr;
        auto* block = block_(address, &page);
        if (block->extend_page_id != invalid_page_id) {
            pager_.delete_page(block->extend_page_id, true);
            block->extend_page_id = invalid_page_id;
        }

        auto available = page->free_bytes() + block->data.size();
        auto in_page = std::min(data.size(), available);
        page->update_block(address.index, buffer_t(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(in_page)));
        block->extend_page_id = write_extend_(data, in_page);
        block->document_length = static_cast<uint32_t>(data.size());
        block->checksum = checksum(data);
        pager_.set_dirty(*page);
        trace(log_,
              "data_service_t::update: {} bytes at {} in collection '{}'",
              data.size(),
              address.to_string(),
              collection.collection_name());
    }

    data_page_t* data_service_t::free_data_page_(collection_page_t& collection, std::size_t length) {
        auto required = data_block_fixed_size + std::min(length, min_block_data_length);
        if (collection.free_data_page_id() != invalid_page_id) {
            auto* page = pager_.get_page<data_page_t>(collection.free_data_page_id());
            if (page->free_bytes() >= required) {
                return page;
            }
        }
        auto* page = pager_.new_page<data_page_t>();
        collection.set_free_data_page_id(page->id());
        pager_.set_dirty(collection);
        return page;
    }

    data_block_t* data_service_t::block_(page_address_t address, data_page_t** page) {
        *page = pager_.get_page<data_page_t>(address.page_id);
        auto* block = (*page)->get_block(address.index);
        if (!block) {
            throw components::base::storage_corrupted(
                fmt::format("data block {} does not exist", address.to_string()));
        }
        return block;
    }

    page_id_t data_service_t::write_extend_(const buffer_t& data, std::size_t offset) {
        page_id_t first = invalid_page_id;
        extend_page_t* previous = nullptr;
        while (offset < data.size()) {
            auto chunk = std::min(data.size() - offset, extend_page_capacity);
            auto* extend = pager_.new_page<extend_page_t>();
            extend->set_data(buffer_t(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                      data.begin() + static_cast<std::ptrdiff_t>(offset + chunk)));
            if (previous) {
                previous->set_next_page_id(extend->id());
            } else {
                first = extend->id();
            }
            previous = extend;
            offset += chunk;
        }
        return first;
    }

} // namespace services::data
