#pragma once

#include <components/document/identity_generator.hpp>
#include <components/log/log.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace configuration {

    struct config_log final {
        std::filesystem::path path;
        std::string name{"burrowdb"};
        log_t::level level{log_t::level::info};
    };

    struct config_storage final {
        /// byte capacity of the collection directory: sum of (name length + 8) over all collections
        std::size_t max_collections_size{3000};
        components::document::auto_id_t default_auto_id{components::document::auto_id_t::object_id};
    };

    struct config final {
        std::filesystem::path main_path;
        config_log log;
        config_storage storage;

        static config create_config(const std::filesystem::path& path);
        static config default_config();
    };

} // namespace configuration
