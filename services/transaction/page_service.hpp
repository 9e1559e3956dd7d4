#pragma once

#include "transaction.hpp"

#include <components/storage/data_page.hpp>

namespace services::transaction {

    /// Page allocation and release on behalf of one transaction.
    class page_service_t {
    public:
        explicit page_service_t(transaction_t& transaction)
            : transaction_(transaction) {}

        template<class T>
        T* new_page() {
            return transaction_.new_page<T>();
        }

        template<class T>
        T* get_page(components::storage::page_id_t id) {
            return transaction_.get_page<T>(id);
        }

        void set_dirty(const components::storage::page_t& page) { transaction_.set_dirty(page); }

        /// Releases page `id`; with `cascade` every extend page chained after it is released too.
        void delete_page(components::storage::page_id_t id, bool cascade = false);

        transaction_t& transaction() noexcept { return transaction_; }

    private:
        transaction_t& transaction_;
    };

} // namespace services::transaction
