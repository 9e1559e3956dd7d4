#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include <components/base/error.hpp>

#include <fmt/format.h>

namespace components::storage {

    using page_id_t = uint32_t;
    using buffer_t = std::vector<char>;

    constexpr page_id_t header_page_id = 0;
    constexpr page_id_t invalid_page_id = UINT32_MAX;
    constexpr uint16_t invalid_slot_index = UINT16_MAX;

    constexpr std::size_t page_size = 8192;
    constexpr std::size_t page_header_size = 32;
    constexpr std::size_t page_available_bytes = page_size - page_header_size;

    enum class page_type : uint8_t
    {
        empty = 0,
        header = 1,
        collection = 2,
        index = 3,
        data = 4,
        extend = 5
    };

    const char* to_string(page_type type) noexcept;

    /// Location of an item (index node or data block) inside a page.
    struct page_address_t {
        page_id_t page_id{invalid_page_id};
        uint16_t index{invalid_slot_index};

        static constexpr std::size_t size = 6;

        page_address_t() = default;
        page_address_t(page_id_t page_id, uint16_t index)
            : page_id(page_id)
            , index(index) {}

        bool is_empty() const noexcept { return page_id == invalid_page_id; }
        std::string to_string() const;

        bool operator==(const page_address_t& other) const noexcept {
            return page_id == other.page_id && index == other.index;
        }
        bool operator!=(const page_address_t& other) const noexcept { return !(*this == other); }
    };

    class page_t;
    using page_ptr = std::unique_ptr<page_t>;

    class page_t {
    public:
        virtual ~page_t() = default;

        page_id_t id() const noexcept { return id_; }
        page_type type() const noexcept { return type_; }

        /// deep copy used to give every transaction a private version of the page
        virtual page_ptr clone() const = 0;

    protected:
        page_t(page_id_t id, page_type type) noexcept
            : id_(id)
            , type_(type) {}
        page_t(const page_t&) = default;
        page_t& operator=(const page_t&) = default;

    private:
        page_id_t id_;
        page_type type_;
    };

    /// Checked downcast; a type mismatch means the page file is corrupted.
    template<class T>
    T* page_cast(page_t* page) {
        if constexpr (std::is_same_v<T, page_t>) {
            return page;
        } else {
            if (page->type() != T::kind) {
                throw base::storage_corrupted(fmt::format("page #{} is {} while {} was expected",
                                                          page->id(),
                                                          to_string(page->type()),
                                                          to_string(T::kind)));
            }
            return static_cast<T*>(page);
        }
    }

} // namespace components::storage
