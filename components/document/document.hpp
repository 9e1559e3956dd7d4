#pragma once

#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "value.hpp"

namespace components::document {

    constexpr std::string_view id_field = "_id";

    /// Ordered set of named values. Field order is kept as inserted.
    class document_t {
    public:
        using field_t = std::pair<std::string, value_t>;
        using storage_t = std::vector<field_t>;
        using const_iterator = storage_t::const_iterator;

        document_t() = default;
        document_t(std::initializer_list<field_t> fields);

        bool contains(std::string_view key) const noexcept;
        const value_t* find(std::string_view key) const noexcept;
        value_t get(std::string_view key) const;

        /// replaces an existing field in place or appends a new one
        void set(std::string_view key, value_t value);
        /// like set, but a new field is placed first
        void set_front(std::string_view key, value_t value);
        bool remove(std::string_view key);

        std::size_t size() const noexcept { return fields_.size(); }
        bool empty() const noexcept { return fields_.empty(); }
        const_iterator begin() const noexcept { return fields_.begin(); }
        const_iterator end() const noexcept { return fields_.end(); }

        int compare(const document_t& other) const noexcept;
        bool operator==(const document_t& other) const noexcept { return compare(other) == 0; }
        bool operator!=(const document_t& other) const noexcept { return compare(other) != 0; }

        std::string to_string() const;

    private:
        value_t* find_(std::string_view key) noexcept;

        storage_t fields_;
    };

    using document_ptr = std::shared_ptr<document_t>;

    template<typename... Args>
    document_ptr make_document(Args&&... args) {
        return std::make_shared<document_t>(std::forward<Args>(args)...);
    }

    inline document_ptr make_document(std::initializer_list<document_t::field_t> fields) {
        return std::make_shared<document_t>(fields);
    }

    using documents_t = std::pmr::vector<document_ptr>;

} // namespace components::document
