#include "configuration.hpp"

namespace configuration {

    config config::create_config(const std::filesystem::path& path) {
        config result;
        result.main_path = path;
        result.log.path = path / "log";
        return result;
    }

    config config::default_config() { return create_config(std::filesystem::current_path()); }

} // namespace configuration
