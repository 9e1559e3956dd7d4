#include "data_page.hpp"

namespace components::storage {

    data_page_t::data_page_t(page_id_t id)
        : page_t(id, kind) {}

    page_ptr data_page_t::clone() const { return std::make_unique<data_page_t>(*this); }

    data_block_t& data_page_t::add_block(data_block_t block) {
        if (block.length() > free_bytes()) {
            throw base::storage_corrupted(
                fmt::format("data block of {} bytes does not fit page #{} ({} bytes free)", block.length(), id(), free_bytes()));
        }
        uint16_t index = 0;
        for (const auto& [used, _] : blocks_) {
            if (used != index) {
                break;
            }
            ++index;
        }
        block.position = page_address_t(id(), index);
        used_bytes_ += block.length();
        return blocks_.emplace(index, std::move(block)).first->second;
    }

    data_block_t* data_page_t::get_block(uint16_t index) noexcept {
        auto it = blocks_.find(index);
        return it == blocks_.end() ? nullptr : &it->second;
    }

    void data_page_t::update_block(uint16_t index, buffer_t data) {
        auto* block = get_block(index);
        if (!block) {
            throw base::storage_corrupted(fmt::format("data block {}:{} does not exist", id(), index));
        }
        if (data.size() > block->data.size() && data.size() - block->data.size() > free_bytes()) {
            throw base::storage_corrupted(fmt::format("data block {}:{} can not grow to {} bytes", id(), index, data.size()));
        }
        used_bytes_ = used_bytes_ - block->data.size() + data.size();
        block->data = std::move(data);
    }

    void data_page_t::delete_block(uint16_t index) {
        auto it = blocks_.find(index);
        if (it == blocks_.end()) {
            throw base::storage_corrupted(fmt::format("data block {}:{} does not exist", id(), index));
        }
        used_bytes_ -= it->second.length();
        blocks_.erase(it);
    }

    extend_page_t::extend_page_t(page_id_t id)
        : page_t(id, kind) {}

    page_ptr extend_page_t::clone() const { return std::make_unique<extend_page_t>(*this); }

    void extend_page_t::set_data(buffer_t data) {
        if (data.size() > extend_page_capacity) {
            throw base::storage_corrupted(fmt::format("extend page #{} can not hold {} bytes", id(), data.size()));
        }
        data_ = std::move(data);
    }

} // namespace components::storage
