#include "page.hpp"

namespace components::storage {

    const char* to_string(page_type type) noexcept {
        switch (type) {
            case page_type::empty:
                return "empty";
            case page_type::header:
                return "header";
            case page_type::collection:
                return "collection";
            case page_type::index:
                return "index";
            case page_type::data:
                return "data";
            case page_type::extend:
                return "extend";
        }
        return "unknown";
    }

    std::string page_address_t::to_string() const {
        if (is_empty()) {
            return "(empty)";
        }
        return fmt::format("{}:{}", page_id, index);
    }

} // namespace components::storage
