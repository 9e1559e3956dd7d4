#include "identity_generator.hpp"

#include <boost/uuid/random_generator.hpp>

#include <mutex>

namespace components::document {

    const char* to_string(auto_id_t mode) noexcept {
        switch (mode) {
            case auto_id_t::object_id:
                return "object_id";
            case auto_id_t::guid:
                return "guid";
            case auto_id_t::datetime:
                return "datetime";
            case auto_id_t::int32:
                return "int32";
            case auto_id_t::int64:
                return "int64";
        }
        return "unknown";
    }

    struct default_identity_generator_t::impl_t {
        std::mutex mutex;
        boost::uuids::random_generator uuid_generator;
    };

    default_identity_generator_t::default_identity_generator_t()
        : impl_(std::make_unique<impl_t>()) {}

    default_identity_generator_t::~default_identity_generator_t() = default;

    object_id_t default_identity_generator_t::object_id() { return object_id_t::generate(); }

    guid_t default_identity_generator_t::guid() {
        // random_generator is not thread safe
        std::lock_guard lock(impl_->mutex);
        return impl_->uuid_generator();
    }

    datetime_t default_identity_generator_t::timestamp() {
        return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
    }

} // namespace components::document
