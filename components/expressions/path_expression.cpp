#include "path_expression.hpp"

#include <components/base/error.hpp>

#include <cctype>

namespace components::expressions {

    namespace {

        bool is_field_char(char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '$';
        }

    } // namespace

    path_expression_t::path_expression_t(std::pmr::memory_resource* resource, std::string_view source)
        : resource_(resource)
        , source_(source)
        , segments_(resource) {
        if (!parse_(source, segments_)) {
            throw base::invalid_format(source);
        }
    }

    bool path_expression_t::is_valid(std::string_view source) noexcept {
        std::pmr::vector<segment_t> segments(std::pmr::new_delete_resource());
        return parse_(source, segments);
    }

    bool path_expression_t::parse_(std::string_view source, std::pmr::vector<segment_t>& segments) {
        if (source.empty() || source.front() != '$') {
            return false;
        }
        std::size_t pos = 1;
        while (pos < source.size()) {
            if (source[pos] == '.') {
                auto begin = ++pos;
                while (pos < source.size() && is_field_char(source[pos])) {
                    ++pos;
                }
                if (pos == begin) {
                    return false;
                }
                segments.push_back({segment_kind::field, std::string(source.substr(begin, pos - begin)), 0});
            } else if (source[pos] == '[') {
                auto close = source.find(']', pos);
                if (close == std::string_view::npos || close == pos + 1) {
                    return false;
                }
                auto inner = source.substr(pos + 1, close - pos - 1);
                if (inner == "*") {
                    segments.push_back({segment_kind::all, {}, 0});
                } else {
                    std::size_t index = 0;
                    for (char c : inner) {
                        if (!std::isdigit(static_cast<unsigned char>(c))) {
                            return false;
                        }
                        index = index * 10 + static_cast<std::size_t>(c - '0');
                    }
                    segments.push_back({segment_kind::index, {}, index});
                }
                pos = close + 1;
            } else {
                return false;
            }
        }
        return true;
    }

    std::pmr::vector<document::value_t> path_expression_t::execute(const document::document_t& document,
                                                                   bool include_null) const {
        std::pmr::vector<document::value_t> result(resource_);
        walk_document_(document, 0, result);
        if (result.empty() && include_null) {
            result.emplace_back();
        }
        return result;
    }

    void path_expression_t::walk_document_(const document::document_t& document,
                                           std::size_t position,
                                           std::pmr::vector<document::value_t>& out) const {
        if (position == segments_.size()) {
            out.emplace_back(document);
            return;
        }
        const auto& segment = segments_[position];
        if (segment.kind != segment_kind::field) {
            return;
        }
        if (const auto* value = document.find(segment.field)) {
            walk_(*value, position + 1, out);
        }
    }

    void path_expression_t::walk_(const document::value_t& value,
                                  std::size_t position,
                                  std::pmr::vector<document::value_t>& out) const {
        if (position == segments_.size()) {
            out.push_back(value);
            return;
        }
        const auto& segment = segments_[position];
        switch (segment.kind) {
            case segment_kind::field:
                if (value.is_document()) {
                    walk_document_(value.as_document(), position, out);
                }
                break;
            case segment_kind::index:
                if (value.is_array() && segment.index < value.as_array().size()) {
                    walk_(value.as_array()[segment.index], position + 1, out);
                }
                break;
            case segment_kind::all:
                if (value.is_array()) {
                    for (const auto& item : value.as_array()) {
                        walk_(item, position + 1, out);
                    }
                }
                break;
        }
    }

} // namespace components::expressions
