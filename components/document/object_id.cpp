#include "object_id.hpp"

#include <components/base/error.hpp>

#include <atomic>
#include <chrono>
#include <cstring>
#include <random>

namespace components::document {

    namespace {

        struct process_unique_t {
            std::array<uint8_t, 5> random;
            std::atomic<uint32_t> counter;

            process_unique_t() {
                std::random_device device;
                std::mt19937 generator(device());
                std::uniform_int_distribution<uint32_t> distribution(0, 0xFFu);
                for (auto& byte : random) {
                    byte = static_cast<uint8_t>(distribution(generator));
                }
                counter.store(generator() & 0xFFFFFFu);
            }
        };

        process_unique_t& process_unique() {
            static process_unique_t instance;
            return instance;
        }

        int from_hex(char c) noexcept {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }

    } // namespace

    object_id_t::object_id_t() noexcept
        : bytes_{} {}

    object_id_t::object_id_t(const bytes_t& bytes) noexcept
        : bytes_(bytes) {}

    object_id_t object_id_t::generate() {
        auto& unique = process_unique();
        auto seconds = static_cast<uint32_t>(
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                .count());
        auto counter = unique.counter.fetch_add(1) & 0xFFFFFFu;

        bytes_t bytes{};
        bytes[0] = static_cast<uint8_t>(seconds >> 24);
        bytes[1] = static_cast<uint8_t>(seconds >> 16);
        bytes[2] = static_cast<uint8_t>(seconds >> 8);
        bytes[3] = static_cast<uint8_t>(seconds);
        std::memcpy(bytes.data() + 4, unique.random.data(), unique.random.size());
        bytes[9] = static_cast<uint8_t>(counter >> 16);
        bytes[10] = static_cast<uint8_t>(counter >> 8);
        bytes[11] = static_cast<uint8_t>(counter);
        return object_id_t(bytes);
    }

    object_id_t object_id_t::from_string(std::string_view hex) {
        if (hex.size() != size * 2) {
            throw base::invalid_format(hex);
        }
        bytes_t bytes{};
        for (std::size_t i = 0; i < size; ++i) {
            auto high = from_hex(hex[i * 2]);
            auto low = from_hex(hex[i * 2 + 1]);
            if (high < 0 || low < 0) {
                throw base::invalid_format(hex);
            }
            bytes[i] = static_cast<uint8_t>((high << 4) | low);
        }
        return object_id_t(bytes);
    }

    uint32_t object_id_t::timestamp() const noexcept {
        return (static_cast<uint32_t>(bytes_[0]) << 24) | (static_cast<uint32_t>(bytes_[1]) << 16) |
               (static_cast<uint32_t>(bytes_[2]) << 8) | static_cast<uint32_t>(bytes_[3]);
    }

    bool object_id_t::is_empty() const noexcept {
        for (auto byte : bytes_) {
            if (byte != 0) {
                return false;
            }
        }
        return true;
    }

    std::string object_id_t::to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string result;
        result.reserve(size * 2);
        for (auto byte : bytes_) {
            result.push_back(digits[byte >> 4]);
            result.push_back(digits[byte & 0x0F]);
        }
        return result;
    }

    int object_id_t::compare(const object_id_t& other) const noexcept {
        auto result = std::memcmp(bytes_.data(), other.bytes_.data(), size);
        return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }

} // namespace components::document
