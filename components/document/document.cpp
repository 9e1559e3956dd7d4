#include "document.hpp"

#include <algorithm>

namespace components::document {

    document_t::document_t(std::initializer_list<field_t> fields) {
        fields_.reserve(fields.size());
        for (const auto& [key, value] : fields) {
            set(key, value);
        }
    }

    bool document_t::contains(std::string_view key) const noexcept { return find(key) != nullptr; }

    const value_t* document_t::find(std::string_view key) const noexcept {
        auto it = std::find_if(fields_.begin(), fields_.end(), [key](const field_t& field) {
            return field.first == key;
        });
        return it == fields_.end() ? nullptr : &it->second;
    }

    value_t* document_t::find_(std::string_view key) noexcept {
        return const_cast<value_t*>(static_cast<const document_t*>(this)->find(key));
    }

    value_t document_t::get(std::string_view key) const {
        const auto* value = find(key);
        return value ? *value : value_t();
    }

    void document_t::set(std::string_view key, value_t value) {
        if (auto* existing = find_(key)) {
            *existing = std::move(value);
            return;
        }
        fields_.emplace_back(std::string(key), std::move(value));
    }

    void document_t::set_front(std::string_view key, value_t value) {
        if (auto* existing = find_(key)) {
            *existing = std::move(value);
            return;
        }
        fields_.emplace(fields_.begin(), std::string(key), std::move(value));
    }

    bool document_t::remove(std::string_view key) {
        auto it = std::find_if(fields_.begin(), fields_.end(), [key](const field_t& field) {
            return field.first == key;
        });
        if (it == fields_.end()) {
            return false;
        }
        fields_.erase(it);
        return true;
    }

    // documents compare field by field in their stored order
    int document_t::compare(const document_t& other) const noexcept {
        auto count = std::min(fields_.size(), other.fields_.size());
        for (std::size_t i = 0; i < count; ++i) {
            const auto& [lhs_key, lhs_value] = fields_[i];
            const auto& [rhs_key, rhs_value] = other.fields_[i];
            if (auto result = lhs_key.compare(rhs_key); result != 0) {
                return result < 0 ? -1 : 1;
            }
            if (auto result = lhs_value.compare(rhs_value); result != 0) {
                return result;
            }
        }
        if (fields_.size() == other.fields_.size()) {
            return 0;
        }
        return fields_.size() < other.fields_.size() ? -1 : 1;
    }

    std::string document_t::to_string() const {
        std::string result = "{";
        bool first = true;
        for (const auto& [key, value] : fields_) {
            if (!first) {
                result += ", ";
            }
            result += '"';
            result += key;
            result += "\": ";
            result += value.to_string();
            first = false;
        }
        return result + "}";
    }

} // namespace components::document
