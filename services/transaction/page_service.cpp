#include "page_service.hpp"

namespace services::transaction {

    using namespace components::storage;

    void page_service_t::delete_page(page_id_t id, bool cascade) {
        if (!cascade) {
            transaction_.delete_page(id);
            return;
        }
        auto* page = transaction_.get_page<page_t>(id);
        page_id_t next = invalid_page_id;
        switch (page->type()) {
            case page_type::data: {
                // a data page owns the extend chains of all its blocks
                for (const auto& [_, block] : page_cast<data_page_t>(page)->blocks()) {
                    if (block.extend_page_id != invalid_page_id) {
                        delete_page(block.extend_page_id, true);
                    }
                }
                break;
            }
            case page_type::extend:
                next = page_cast<extend_page_t>(page)->next_page_id();
                break;
            default:
                break;
        }
        transaction_.delete_page(id);
        while (next != invalid_page_id) {
            auto* extend = transaction_.get_page<extend_page_t>(next);
            auto following = extend->next_page_id();
            transaction_.delete_page(next);
            next = following;
        }
    }

} // namespace services::transaction
