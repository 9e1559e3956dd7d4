#include "value.hpp"
#include "document.hpp"

#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace components::document {

    namespace {

        template<typename T>
        int compare_scalar(const T& lhs, const T& rhs) noexcept {
            if (lhs < rhs) {
                return -1;
            }
            if (rhs < lhs) {
                return 1;
            }
            return 0;
        }

        // int32, int64 and double share one ordering rank
        int type_rank(value_type type) noexcept {
            switch (type) {
                case value_type::int64:
                case value_type::double_value:
                    return static_cast<int>(value_type::int32);
                default:
                    return static_cast<int>(type);
            }
        }

    } // namespace

    const char* to_string(value_type type) noexcept {
        switch (type) {
            case value_type::min_value:
                return "min_value";
            case value_type::null:
                return "null";
            case value_type::int32:
                return "int32";
            case value_type::int64:
                return "int64";
            case value_type::double_value:
                return "double";
            case value_type::string:
                return "string";
            case value_type::document:
                return "document";
            case value_type::array:
                return "array";
            case value_type::binary:
                return "binary";
            case value_type::object_id:
                return "object_id";
            case value_type::guid:
                return "guid";
            case value_type::boolean:
                return "boolean";
            case value_type::datetime:
                return "datetime";
            case value_type::max_value:
                return "max_value";
        }
        return "unknown";
    }

    value_t::value_t() noexcept
        : storage_(std::monostate{}) {}

    value_t::value_t(std::nullptr_t) noexcept
        : storage_(std::monostate{}) {}

    value_t::value_t(bool value) noexcept
        : storage_(value) {}

    value_t::value_t(int32_t value) noexcept
        : storage_(value) {}

    value_t::value_t(int64_t value) noexcept
        : storage_(value) {}

    value_t::value_t(double value) noexcept
        : storage_(value) {}

    value_t::value_t(const char* value)
        : storage_(std::string(value)) {}

    value_t::value_t(std::string value)
        : storage_(std::move(value)) {}

    value_t::value_t(object_id_t value) noexcept
        : storage_(value) {}

    value_t::value_t(guid_t value) noexcept
        : storage_(value) {}

    value_t::value_t(datetime_t value) noexcept
        : storage_(value) {}

    value_t::value_t(binary_t value)
        : storage_(std::make_shared<const binary_t>(std::move(value))) {}

    value_t::value_t(array_t value)
        : storage_(std::make_shared<const array_t>(std::move(value))) {}

    value_t::value_t(document_t value)
        : storage_(std::make_shared<const document_t>(std::move(value))) {}

    value_t::value_t(storage_t storage) noexcept
        : storage_(std::move(storage)) {}

    value_t value_t::min_value() noexcept { return value_t(storage_t(min_tag{})); }

    value_t value_t::max_value() noexcept { return value_t(storage_t(max_tag{})); }

    value_type value_t::type() const noexcept { return static_cast<value_type>(storage_.index()); }

    bool value_t::is_number() const noexcept {
        auto t = type();
        return t == value_type::int32 || t == value_type::int64 || t == value_type::double_value;
    }

    int32_t value_t::as_int32() const noexcept { return static_cast<int32_t>(as_int64()); }

    int64_t value_t::as_int64() const noexcept {
        switch (type()) {
            case value_type::int32:
                return std::get<int32_t>(storage_);
            case value_type::int64:
                return std::get<int64_t>(storage_);
            case value_type::double_value: {
                auto value = std::get<double>(storage_);
                if (std::isnan(value)) {
                    return 0;
                }
                // 2^63 is exact as a double, INT64_MAX is not
                if (value >= 9223372036854775808.0) {
                    return std::numeric_limits<int64_t>::max();
                }
                if (value < -9223372036854775808.0) {
                    return std::numeric_limits<int64_t>::min();
                }
                return static_cast<int64_t>(value);
            }
            default:
                return 0;
        }
    }

    double value_t::as_double() const noexcept {
        switch (type()) {
            case value_type::int32:
                return std::get<int32_t>(storage_);
            case value_type::int64:
                return static_cast<double>(std::get<int64_t>(storage_));
            case value_type::double_value:
                return std::get<double>(storage_);
            default:
                return 0.0;
        }
    }

    bool value_t::as_bool() const { return std::get<bool>(storage_); }

    const std::string& value_t::as_string() const { return std::get<std::string>(storage_); }

    const object_id_t& value_t::as_object_id() const { return std::get<object_id_t>(storage_); }

    const guid_t& value_t::as_guid() const { return std::get<guid_t>(storage_); }

    datetime_t value_t::as_datetime() const { return std::get<datetime_t>(storage_); }

    const binary_t& value_t::as_binary() const { return *std::get<std::shared_ptr<const binary_t>>(storage_); }

    const array_t& value_t::as_array() const { return *std::get<std::shared_ptr<const array_t>>(storage_); }

    const document_t& value_t::as_document() const { return *std::get<std::shared_ptr<const document_t>>(storage_); }

    int value_t::compare(const value_t& other) const noexcept {
        auto lhs_type = type();
        auto rhs_type = other.type();
        auto lhs_rank = type_rank(lhs_type);
        auto rhs_rank = type_rank(rhs_type);
        if (lhs_rank != rhs_rank) {
            return lhs_rank < rhs_rank ? -1 : 1;
        }

        switch (lhs_type) {
            case value_type::min_value:
            case value_type::null:
            case value_type::max_value:
                return 0;
            case value_type::int32:
            case value_type::int64:
            case value_type::double_value:
                if (lhs_type == value_type::double_value || rhs_type == value_type::double_value) {
                    return compare_scalar(as_double(), other.as_double());
                }
                return compare_scalar(as_int64(), other.as_int64());
            case value_type::string: {
                auto result = as_string().compare(other.as_string());
                return result < 0 ? -1 : (result > 0 ? 1 : 0);
            }
            case value_type::document:
                return as_document().compare(other.as_document());
            case value_type::array: {
                const auto& lhs = as_array();
                const auto& rhs = other.as_array();
                auto count = std::min(lhs.size(), rhs.size());
                for (std::size_t i = 0; i < count; ++i) {
                    if (auto result = lhs[i].compare(rhs[i]); result != 0) {
                        return result;
                    }
                }
                return compare_scalar(lhs.size(), rhs.size());
            }
            case value_type::binary: {
                const auto& lhs = as_binary();
                const auto& rhs = other.as_binary();
                if (lhs.size() != rhs.size()) {
                    return compare_scalar(lhs.size(), rhs.size());
                }
                auto result = lhs.empty() ? 0 : std::memcmp(lhs.data(), rhs.data(), lhs.size());
                return result < 0 ? -1 : (result > 0 ? 1 : 0);
            }
            case value_type::object_id:
                return as_object_id().compare(other.as_object_id());
            case value_type::guid:
                return compare_scalar(as_guid(), other.as_guid());
            case value_type::boolean:
                return compare_scalar(as_bool(), other.as_bool());
            case value_type::datetime:
                return compare_scalar(as_datetime(), other.as_datetime());
        }
        return 0;
    }

    std::size_t value_t::estimated_size() const noexcept {
        switch (type()) {
            case value_type::min_value:
            case value_type::null:
            case value_type::max_value:
                return 1;
            case value_type::boolean:
                return 2;
            case value_type::int32:
                return 5;
            case value_type::int64:
            case value_type::double_value:
            case value_type::datetime:
                return 9;
            case value_type::object_id:
                return 1 + object_id_t::size;
            case value_type::guid:
                return 17;
            case value_type::string:
                return 5 + as_string().size();
            case value_type::binary:
                return 5 + as_binary().size();
            case value_type::array: {
                std::size_t size = 5;
                for (const auto& item : as_array()) {
                    size += item.estimated_size();
                }
                return size;
            }
            case value_type::document: {
                std::size_t size = 5;
                for (const auto& [key, item] : as_document()) {
                    size += 1 + key.size() + item.estimated_size();
                }
                return size;
            }
        }
        return 1;
    }

    std::string value_t::to_string() const {
        switch (type()) {
            case value_type::min_value:
                return "$minValue";
            case value_type::null:
                return "null";
            case value_type::max_value:
                return "$maxValue";
            case value_type::boolean:
                return as_bool() ? "true" : "false";
            case value_type::int32:
            case value_type::int64:
                return std::to_string(as_int64());
            case value_type::double_value:
                return fmt::format("{}", as_double());
            case value_type::string:
                return fmt::format("\"{}\"", as_string());
            case value_type::object_id:
                return fmt::format("{{\"$oid\": \"{}\"}}", as_object_id().to_string());
            case value_type::guid:
                return fmt::format("{{\"$guid\": \"{}\"}}", boost::uuids::to_string(as_guid()));
            case value_type::datetime:
                return fmt::format("{{\"$date\": {}}}", as_datetime().time_since_epoch().count());
            case value_type::binary:
                return fmt::format("{{\"$binary\": {} bytes}}", as_binary().size());
            case value_type::array: {
                std::string result = "[";
                bool first = true;
                for (const auto& item : as_array()) {
                    if (!first) {
                        result += ", ";
                    }
                    result += item.to_string();
                    first = false;
                }
                return result + "]";
            }
            case value_type::document:
                return as_document().to_string();
        }
        return {};
    }

} // namespace components::document
