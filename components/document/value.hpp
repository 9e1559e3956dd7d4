#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <boost/uuid/uuid.hpp>

#include "object_id.hpp"

namespace components::document {

    class document_t;
    class value_t;

    using guid_t = boost::uuids::uuid;
    using datetime_t = std::chrono::sys_time<std::chrono::microseconds>;
    using binary_t = std::vector<uint8_t>;
    using array_t = std::vector<value_t>;

    /// Declaration order is the cross-type sort order of values.
    enum class value_type : uint8_t
    {
        min_value = 0,
        null = 1,
        int32 = 2,
        int64 = 3,
        double_value = 4,
        string = 5,
        document = 6,
        array = 7,
        binary = 8,
        object_id = 9,
        guid = 10,
        boolean = 11,
        datetime = 12,
        max_value = 13
    };

    const char* to_string(value_type type) noexcept;

    class value_t {
    public:
        value_t() noexcept;
        value_t(std::nullptr_t) noexcept;
        value_t(bool value) noexcept;
        value_t(int32_t value) noexcept;
        value_t(int64_t value) noexcept;
        value_t(double value) noexcept;
        value_t(const char* value);
        value_t(std::string value);
        value_t(object_id_t value) noexcept;
        value_t(guid_t value) noexcept;
        value_t(datetime_t value) noexcept;
        value_t(binary_t value);
        value_t(array_t value);
        value_t(document_t value);

        static value_t min_value() noexcept;
        static value_t max_value() noexcept;

        value_type type() const noexcept;

        bool is_null() const noexcept { return type() == value_type::null; }
        bool is_min_value() const noexcept { return type() == value_type::min_value; }
        bool is_max_value() const noexcept { return type() == value_type::max_value; }
        bool is_number() const noexcept;
        bool is_int32() const noexcept { return type() == value_type::int32; }
        bool is_int64() const noexcept { return type() == value_type::int64; }
        bool is_double() const noexcept { return type() == value_type::double_value; }
        bool is_string() const noexcept { return type() == value_type::string; }
        bool is_document() const noexcept { return type() == value_type::document; }
        bool is_array() const noexcept { return type() == value_type::array; }
        bool is_binary() const noexcept { return type() == value_type::binary; }
        bool is_object_id() const noexcept { return type() == value_type::object_id; }
        bool is_guid() const noexcept { return type() == value_type::guid; }
        bool is_bool() const noexcept { return type() == value_type::boolean; }
        bool is_datetime() const noexcept { return type() == value_type::datetime; }

        // numeric accessors convert between number types and yield 0 for anything else
        int32_t as_int32() const noexcept;
        int64_t as_int64() const noexcept;
        double as_double() const noexcept;

        bool as_bool() const;
        const std::string& as_string() const;
        const object_id_t& as_object_id() const;
        const guid_t& as_guid() const;
        datetime_t as_datetime() const;
        const binary_t& as_binary() const;
        const array_t& as_array() const;
        const document_t& as_document() const;

        /// -1, 0 or 1. Values of different types order by value_type, numbers compare by value.
        int compare(const value_t& other) const noexcept;

        bool operator==(const value_t& rhs) const noexcept { return compare(rhs) == 0; }
        bool operator!=(const value_t& rhs) const noexcept { return compare(rhs) != 0; }
        bool operator<(const value_t& rhs) const noexcept { return compare(rhs) < 0; }
        bool operator>(const value_t& rhs) const noexcept { return compare(rhs) > 0; }
        bool operator<=(const value_t& rhs) const noexcept { return compare(rhs) <= 0; }
        bool operator>=(const value_t& rhs) const noexcept { return compare(rhs) >= 0; }

        /// approximate encoded size in bytes, used for page accounting and key length limits
        std::size_t estimated_size() const noexcept;
        std::string to_string() const;

    private:
        struct min_tag {};
        struct max_tag {};

        using storage_t = std::variant<min_tag,
                                       std::monostate,
                                       int32_t,
                                       int64_t,
                                       double,
                                       std::string,
                                       std::shared_ptr<const document_t>,
                                       std::shared_ptr<const array_t>,
                                       std::shared_ptr<const binary_t>,
                                       object_id_t,
                                       guid_t,
                                       bool,
                                       datetime_t,
                                       max_tag>;

        explicit value_t(storage_t storage) noexcept;

        storage_t storage_;
    };

} // namespace components::document
