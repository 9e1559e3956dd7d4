#pragma once

#include <cstdint>
#include <memory>

#include "value.hpp"

namespace components::document {

    /// How an identity is synthesized for a document inserted without `_id`.
    enum class auto_id_t : uint8_t
    {
        object_id = 1,
        guid = 2,
        datetime = 3,
        int32 = 4,
        int64 = 5
    };

    const char* to_string(auto_id_t mode) noexcept;

    class identity_generator_t {
    public:
        virtual ~identity_generator_t() = default;

        virtual object_id_t object_id() = 0;
        virtual guid_t guid() = 0;
        virtual datetime_t timestamp() = 0;
    };

    class default_identity_generator_t final : public identity_generator_t {
    public:
        default_identity_generator_t();
        ~default_identity_generator_t() override;

        object_id_t object_id() override;
        guid_t guid() override;
        datetime_t timestamp() override;

    private:
        struct impl_t;
        std::unique_ptr<impl_t> impl_;
    };

} // namespace components::document
