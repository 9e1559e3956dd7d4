#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace core {

    inline char ascii_lower(char c) noexcept {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    inline bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                   return ascii_lower(a) == ascii_lower(b);
               });
    }

    inline bool is_blank(std::string_view str) noexcept {
        return std::all_of(str.begin(), str.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
    }

    // ordinal, ascii case-insensitive ordering; transparent so maps can be searched by string_view
    struct iless {
        using is_transparent = void;

        bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
            return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
                return ascii_lower(a) < ascii_lower(b);
            });
        }
    };

} // namespace core
