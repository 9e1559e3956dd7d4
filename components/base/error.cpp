#include "error.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace components::base {

    std::string_view to_string(error_code_t code) noexcept { return magic_enum::enum_name(code); }

    engine_exception_t::engine_exception_t(error_code_t code, const std::string& what)
        : std::runtime_error(fmt::format("[{}] {}", to_string(code), what))
        , code_(code) {}

    engine_exception_t argument_error(std::string_view argument) {
        return {error_code_t::argument_error, fmt::format("argument '{}' can not be null or empty", argument)};
    }

    engine_exception_t invalid_format(std::string_view value) {
        return {error_code_t::invalid_format, fmt::format("invalid format: {}", value)};
    }

    engine_exception_t collection_limit_exceeded(std::size_t limit) {
        return {error_code_t::collection_limit_exceeded,
                fmt::format("this database is full: collection names can not exceed {} bytes", limit)};
    }

    engine_exception_t already_exists_collection_name(std::string_view name) {
        return {error_code_t::already_exists, fmt::format("collection '{}' already exists", name)};
    }

    engine_exception_t invalid_data_type(std::string_view field, std::string_view value) {
        return {error_code_t::invalid_data_type, fmt::format("invalid data type in field '{}': {}", field, value)};
    }

    engine_exception_t index_limit_exceeded(std::string_view collection, std::size_t limit) {
        return {error_code_t::index_limit_exceeded,
                fmt::format("collection '{}' can not have more than {} indexes", collection, limit)};
    }

    engine_exception_t index_duplicate_key(std::string_view index, std::string_view key) {
        return {error_code_t::index_duplicate_key,
                fmt::format("cannot insert duplicate key in unique index '{}': {}", index, key)};
    }

    engine_exception_t index_key_too_long(std::string_view index, std::size_t length, std::size_t limit) {
        return {error_code_t::index_key_too_long,
                fmt::format("key of index '{}' is {} bytes, limit is {} bytes", index, length, limit)};
    }

    engine_exception_t page_not_found(uint32_t page_id) {
        return {error_code_t::page_not_found, fmt::format("page #{} is not allocated", page_id)};
    }

    engine_exception_t storage_corrupted(std::string_view reason) {
        return {error_code_t::storage_corrupted, fmt::format("storage corrupted: {}", reason)};
    }

    engine_exception_t transaction_closed(uint64_t transaction_id) {
        return {error_code_t::transaction_closed,
                fmt::format("transaction {} is already committed or rolled back", transaction_id)};
    }

} // namespace components::base
