#pragma once

#include "page.hpp"

#include <core/string_utils.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace components::storage {

    /// serialized cost of one directory entry besides its name: 4 bytes name length + 4 bytes page id
    constexpr std::size_t collection_entry_overhead = 8;

    /// Page 0: maps collection names to the pages holding their descriptors.
    /// Names are unique ignoring ascii case.
    class header_page_t final : public page_t {
    public:
        static constexpr page_type kind = page_type::header;
        using collections_t = std::map<std::string, page_id_t, core::iless>;

        explicit header_page_t(page_id_t id = header_page_id);

        page_ptr clone() const override;

        const collections_t& collections() const noexcept { return collections_; }
        std::optional<page_id_t> find_collection(std::string_view name) const;
        void add_collection(std::string_view name, page_id_t page_id);
        bool remove_collection(std::string_view name);

        /// sum of (name length + entry overhead) over all entries
        std::size_t collections_size() const noexcept;

    private:
        collections_t collections_;
    };

} // namespace components::storage
