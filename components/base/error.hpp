#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace components::base {

    enum class error_code_t : int32_t
    {
        other_error = -1,
        none = 0,
        argument_error = 1,
        invalid_format = 2,
        collection_limit_exceeded = 3,
        already_exists = 4,
        invalid_data_type = 5,
        index_limit_exceeded = 6,
        index_duplicate_key = 7,
        index_key_too_long = 8,
        page_not_found = 9,
        storage_corrupted = 10,
        transaction_closed = 11,
    };

    std::string_view to_string(error_code_t code) noexcept;

    class engine_exception_t final : public std::runtime_error {
    public:
        engine_exception_t(error_code_t code, const std::string& what);

        error_code_t code() const noexcept { return code_; }

    private:
        error_code_t code_;
    };

    engine_exception_t argument_error(std::string_view argument);
    engine_exception_t invalid_format(std::string_view value);
    engine_exception_t collection_limit_exceeded(std::size_t limit);
    engine_exception_t already_exists_collection_name(std::string_view name);
    engine_exception_t invalid_data_type(std::string_view field, std::string_view value);
    engine_exception_t index_limit_exceeded(std::string_view collection, std::size_t limit);
    engine_exception_t index_duplicate_key(std::string_view index, std::string_view key);
    engine_exception_t index_key_too_long(std::string_view index, std::size_t length, std::size_t limit);
    engine_exception_t page_not_found(uint32_t page_id);
    engine_exception_t storage_corrupted(std::string_view reason);
    engine_exception_t transaction_closed(uint64_t transaction_id);

} // namespace components::base
