#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace components::document {

    /// 12-byte globally unique identifier: 4 bytes of seconds since epoch (big endian),
    /// 5 process-random bytes and a 3-byte counter.
    class object_id_t {
    public:
        static constexpr std::size_t size = 12;
        using bytes_t = std::array<uint8_t, size>;

        object_id_t() noexcept;
        explicit object_id_t(const bytes_t& bytes) noexcept;

        static object_id_t generate();
        static object_id_t from_string(std::string_view hex);

        uint32_t timestamp() const noexcept;
        const bytes_t& bytes() const noexcept { return bytes_; }
        bool is_empty() const noexcept;
        std::string to_string() const;

        int compare(const object_id_t& other) const noexcept;
        bool operator==(const object_id_t& other) const noexcept { return bytes_ == other.bytes_; }
        bool operator!=(const object_id_t& other) const noexcept { return bytes_ != other.bytes_; }
        bool operator<(const object_id_t& other) const noexcept { return compare(other) < 0; }

    private:
        bytes_t bytes_;
    };

} // namespace components::document
