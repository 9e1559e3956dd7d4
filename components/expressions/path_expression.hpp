#pragma once

#include <components/document/document.hpp>

#include <memory_resource>
#include <string>
#include <string_view>

namespace components::expressions {

    /// Path over a document used to compute index keys.
    ///
    /// Grammar: `$` followed by any number of `.field`, `[n]` or `[*]` segments,
    /// e.g. `$._id`, `$.address.city`, `$.tags[*]`, `$.items[*].sku`, `$.list[0]`.
    /// `[*]` fans out over every element of an array, so one document may produce many keys.
    class path_expression_t {
    public:
        path_expression_t(std::pmr::memory_resource* resource, std::string_view source);

        const std::string& source() const noexcept { return source_; }

        /// Values addressed by the path, in document order.
        /// When nothing is addressed and `include_null` is set the result is a single null.
        std::pmr::vector<document::value_t> execute(const document::document_t& document,
                                                    bool include_null = true) const;

        static bool is_valid(std::string_view source) noexcept;

    private:
        enum class segment_kind : uint8_t
        {
            field,
            index,
            all
        };

        struct segment_t {
            segment_kind kind;
            std::string field;
            std::size_t index{0};
        };

        static bool parse_(std::string_view source, std::pmr::vector<segment_t>& segments);

        void walk_(const document::value_t& value, std::size_t position, std::pmr::vector<document::value_t>& out)
            const;
        void walk_document_(const document::document_t& document,
                            std::size_t position,
                            std::pmr::vector<document::value_t>& out) const;

        std::pmr::memory_resource* resource_;
        std::string source_;
        std::pmr::vector<segment_t> segments_;
    };

} // namespace components::expressions
